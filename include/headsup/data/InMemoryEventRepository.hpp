#pragma once

#include <QHash>

#include "headsup/data/EventRepository.hpp"

namespace headsup {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<MeetingEvent> fetchEvents(const QDate &from, const QDate &to) const override;
    std::optional<MeetingEvent> findById(const QString &id) const override;
    bool reload() override;

    MeetingEvent addEvent(MeetingEvent event);
    bool updateEvent(const MeetingEvent &event);
    bool removeEvent(const QString &id);

private:
    QHash<QString, MeetingEvent> m_events;
};

} // namespace data
} // namespace headsup
