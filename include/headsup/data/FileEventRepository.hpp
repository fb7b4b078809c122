#pragma once

#include "headsup/data/EventRepository.hpp"
#include "headsup/data/FileCalendarStorage.hpp"

#include <memory>

namespace headsup {
namespace data {

class FileEventRepository : public EventRepository
{
public:
    explicit FileEventRepository(std::shared_ptr<FileCalendarStorage> storage);
    ~FileEventRepository() override = default;

    std::vector<MeetingEvent> fetchEvents(const QDate &from, const QDate &to) const override;
    std::optional<MeetingEvent> findById(const QString &id) const override;
    bool reload() override;

private:
    std::shared_ptr<FileCalendarStorage> m_storage;
};

} // namespace data
} // namespace headsup
