#pragma once

#include <QDateTime>
#include <memory>
#include <vector>

#include "headsup/core/Alert.hpp"
#include "headsup/core/TimingPreferences.hpp"

namespace headsup {
namespace core {

/**
 * Maps an event and the timing preferences to the alerts it needs.
 *
 * - The overlay reminder fires defaultMinutes before start, or, with
 *   length-based timing, the short/medium/long tier for the meeting length
 *   (< 30 min, 30-60 min inclusive, > 60 min).
 * - With sound enabled a second reminder fires soundMinutes before start,
 *   whichever way the overlay is timed, unless that coincides with the
 *   overlay reminder.
 * - With auto-join enabled, events with a joinable link also get a
 *   MeetingStart alert at their start time.
 *
 * Events that have ended or already started produce nothing. When the
 * overlay reminder time has already passed but the meeting has not started
 * yet, the reminder is returned as a catch-up alert with triggerAt == now.
 */
class TimingPolicy
{
public:
    static int lengthTierMinutes(const data::MeetingEvent &event, const TimingPreferences &prefs);
    static int reminderMinutes(const data::MeetingEvent &event, const TimingPreferences &prefs);
    static int alertMinutes(const TimingPreferences &prefs);

    static std::vector<Alert> computeFireTimes(const std::shared_ptr<const data::MeetingEvent> &event,
                                               const TimingPreferences &prefs, const QDateTime &now);
};

} // namespace core
} // namespace headsup
