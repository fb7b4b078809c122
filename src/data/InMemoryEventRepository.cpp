#include "headsup/data/InMemoryEventRepository.hpp"

#include <QUuid>
#include <algorithm>

namespace headsup {
namespace data {

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<MeetingEvent> InMemoryEventRepository::fetchEvents(const QDate &from, const QDate &to) const
{
    std::vector<MeetingEvent> events;
    for (const auto &event : m_events) {
        if (event.end.toLocalTime().date() < from || event.start.toLocalTime().date() > to) {
            continue;
        }
        events.push_back(event);
    }
    std::sort(events.begin(), events.end(), [](const MeetingEvent &lhs, const MeetingEvent &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
    return events;
}

std::optional<MeetingEvent> InMemoryEventRepository::findById(const QString &id) const
{
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

bool InMemoryEventRepository::reload()
{
    return true;
}

MeetingEvent InMemoryEventRepository::addEvent(MeetingEvent event)
{
    if (event.id.isEmpty()) {
        event.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (!event.end.isValid() || event.end <= event.start) {
        event.end = event.start.addSecs(30 * 60);
    }
    m_events.insert(event.id, event);
    return event;
}

bool InMemoryEventRepository::updateEvent(const MeetingEvent &event)
{
    if (!m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryEventRepository::removeEvent(const QString &id)
{
    return m_events.remove(id) > 0;
}

} // namespace data
} // namespace headsup
