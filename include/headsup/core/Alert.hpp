#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <memory>

#include "headsup/data/Event.hpp"

namespace headsup {
namespace core {

enum class AlertKind {
    Reminder,
    Snooze,
    MeetingStart
};

// Which preference produced a reminder. Overlay and sound reminders are
// timed independently but presented the same way.
enum class AlertChannel {
    Overlay,
    Sound
};

class Alert
{
public:
    static Alert reminder(std::shared_ptr<const data::MeetingEvent> event, const QDateTime &triggerAt,
                          int minutesBefore, AlertChannel channel = AlertChannel::Overlay);
    static Alert snooze(std::shared_ptr<const data::MeetingEvent> event, const QDateTime &until);
    static Alert meetingStart(std::shared_ptr<const data::MeetingEvent> event);

    const QUuid &id() const { return m_id; }
    const data::MeetingEvent &event() const { return *m_event; }
    const std::shared_ptr<const data::MeetingEvent> &eventPtr() const { return m_event; }
    const QDateTime &triggerAt() const { return m_triggerAt; }
    AlertKind kind() const { return m_kind; }
    AlertChannel channel() const { return m_channel; }
    int minutesBefore() const { return m_minutesBefore; }
    const QDateTime &snoozeUntil() const { return m_triggerAt; }

    // Set for reminders whose nominal time had already passed when computed;
    // such alerts carry triggerAt == computation time and fire immediately.
    bool isCatchUp() const { return m_catchUp; }
    void markCatchUp() { m_catchUp = true; }

    bool isDue(const QDateTime &now) const { return now >= m_triggerAt; }
    qint64 remainingMsecs(const QDateTime &now) const { return now.msecsTo(m_triggerAt); }

    // Rebinds the alert to a newer copy of the same event, keeping id and time.
    void setEvent(std::shared_ptr<const data::MeetingEvent> event);

    QString describe() const;

private:
    Alert(std::shared_ptr<const data::MeetingEvent> event, const QDateTime &triggerAt, AlertKind kind);

    QUuid m_id;
    std::shared_ptr<const data::MeetingEvent> m_event;
    QDateTime m_triggerAt;
    AlertKind m_kind = AlertKind::Reminder;
    AlertChannel m_channel = AlertChannel::Overlay;
    int m_minutesBefore = 0;
    bool m_catchUp = false;
};

} // namespace core
} // namespace headsup
