#include "headsup/core/TimingPolicy.hpp"

namespace headsup {
namespace core {

namespace {
constexpr qint64 kShortMeetingLimitMinutes = 30;
constexpr qint64 kMediumMeetingLimitMinutes = 60;
} // namespace

int TimingPolicy::lengthTierMinutes(const data::MeetingEvent &event, const TimingPreferences &prefs)
{
    const qint64 durationMinutes = event.duration() / 60;
    if (durationMinutes < kShortMeetingLimitMinutes) {
        return prefs.shortMeetingMinutes;
    }
    if (durationMinutes <= kMediumMeetingLimitMinutes) {
        return prefs.mediumMeetingMinutes;
    }
    return prefs.longMeetingMinutes;
}

int TimingPolicy::reminderMinutes(const data::MeetingEvent &event, const TimingPreferences &prefs)
{
    return prefs.useLengthBasedTiming ? lengthTierMinutes(event, prefs) : prefs.defaultMinutes;
}

int TimingPolicy::alertMinutes(const TimingPreferences &prefs)
{
    return prefs.soundMinutes;
}

std::vector<Alert> TimingPolicy::computeFireTimes(const std::shared_ptr<const data::MeetingEvent> &event,
                                                  const TimingPreferences &prefs, const QDateTime &now)
{
    std::vector<Alert> alerts;
    if (!event || !event->start.isValid()) {
        return alerts;
    }
    if (event->end < now || event->start <= now) {
        return alerts;
    }

    const int overlayMinutes = reminderMinutes(*event, prefs);
    const QDateTime overlayAt = event->start.addSecs(-60 * static_cast<qint64>(overlayMinutes));
    if (overlayAt > now) {
        alerts.push_back(Alert::reminder(event, overlayAt, overlayMinutes));
    } else {
        Alert catchUp = Alert::reminder(event, now, overlayMinutes);
        catchUp.markCatchUp();
        alerts.push_back(std::move(catchUp));
    }

    if (prefs.soundEnabled) {
        const int soundMinutes = alertMinutes(prefs);
        const QDateTime soundAt = event->start.addSecs(-60 * static_cast<qint64>(soundMinutes));
        if (soundAt > now && soundAt != overlayAt) {
            alerts.push_back(Alert::reminder(event, soundAt, soundMinutes, AlertChannel::Sound));
        }
    }

    if (prefs.autoJoinEnabled && event->primaryLink()) {
        alerts.push_back(Alert::meetingStart(event));
    }

    return alerts;
}

} // namespace core
} // namespace headsup
