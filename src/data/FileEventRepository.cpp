#include "headsup/data/FileEventRepository.hpp"

#include <algorithm>

namespace headsup {
namespace data {

FileEventRepository::FileEventRepository(std::shared_ptr<FileCalendarStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<MeetingEvent> FileEventRepository::fetchEvents(const QDate &from, const QDate &to) const
{
    std::vector<MeetingEvent> result;
    if (!m_storage) {
        return result;
    }

    const auto &events = m_storage->events();
    result.reserve(static_cast<size_t>(events.size()));
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        const auto &event = it.value();
        if (event.end.toLocalTime().date() < from || event.start.toLocalTime().date() > to) {
            continue;
        }
        result.push_back(event);
    }
    std::sort(result.begin(), result.end(), [](const MeetingEvent &lhs, const MeetingEvent &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
    return result;
}

std::optional<MeetingEvent> FileEventRepository::findById(const QString &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &events = m_storage->events();
    if (events.contains(id)) {
        return events.value(id);
    }
    return std::nullopt;
}

bool FileEventRepository::reload()
{
    if (!m_storage) {
        return false;
    }
    return m_storage->load();
}

} // namespace data
} // namespace headsup
