#include "headsup/core/Alert.hpp"

namespace headsup {
namespace core {

Alert::Alert(std::shared_ptr<const data::MeetingEvent> event, const QDateTime &triggerAt, AlertKind kind)
    : m_id(QUuid::createUuid())
    , m_event(std::move(event))
    , m_triggerAt(triggerAt)
    , m_kind(kind)
{
}

Alert Alert::reminder(std::shared_ptr<const data::MeetingEvent> event, const QDateTime &triggerAt,
                      int minutesBefore, AlertChannel channel)
{
    Alert alert(std::move(event), triggerAt, AlertKind::Reminder);
    alert.m_minutesBefore = minutesBefore;
    alert.m_channel = channel;
    return alert;
}

Alert Alert::snooze(std::shared_ptr<const data::MeetingEvent> event, const QDateTime &until)
{
    return Alert(std::move(event), until, AlertKind::Snooze);
}

Alert Alert::meetingStart(std::shared_ptr<const data::MeetingEvent> event)
{
    const QDateTime start = event->start;
    return Alert(std::move(event), start, AlertKind::MeetingStart);
}

void Alert::setEvent(std::shared_ptr<const data::MeetingEvent> event)
{
    if (event) {
        m_event = std::move(event);
    }
}

QString Alert::describe() const
{
    QString text;
    switch (m_kind) {
    case AlertKind::Reminder:
        text = QStringLiteral("reminder(%1min%2)")
                   .arg(m_minutesBefore)
                   .arg(m_channel == AlertChannel::Sound ? QStringLiteral(", sound") : QString());
        break;
    case AlertKind::Snooze:
        text = QStringLiteral("snooze(until %1)").arg(m_triggerAt.toString(Qt::ISODate));
        break;
    case AlertKind::MeetingStart:
        text = QStringLiteral("meetingStart");
        break;
    }
    return QStringLiteral("%1 for '%2' at %3").arg(text, m_event->title, m_triggerAt.toString(Qt::ISODate));
}

} // namespace core
} // namespace headsup
