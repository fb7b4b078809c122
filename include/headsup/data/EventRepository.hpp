#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "headsup/data/Event.hpp"

namespace headsup {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Events overlapping [from, to], ordered by start then end.
    virtual std::vector<MeetingEvent> fetchEvents(const QDate &from, const QDate &to) const = 0;
    virtual std::optional<MeetingEvent> findById(const QString &id) const = 0;
    // Re-reads the backing source. On failure the previously loaded events stay available.
    virtual bool reload() = 0;
};

} // namespace data
} // namespace headsup
