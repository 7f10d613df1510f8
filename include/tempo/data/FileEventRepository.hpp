#pragma once

#include "tempo/data/EventRepository.hpp"
#include "tempo/data/FileCalendarStorage.hpp"

#include <memory>

namespace tempo {
namespace data {

class FileEventRepository : public EventRepository
{
public:
    explicit FileEventRepository(std::shared_ptr<FileCalendarStorage> storage);
    ~FileEventRepository() override = default;

    std::vector<CalendarEvent> fetchEvents(const QString &owner, const QDateTime &from,
                                           const QDateTime &to) const override;
    std::vector<CalendarEvent> fetchAll(const QString &owner) const override;
    std::optional<CalendarEvent> findById(const QUuid &id) const override;
    std::optional<CalendarEvent> addEvent(CalendarEvent event) override;
    bool updateEvent(const CalendarEvent &event) override;
    bool removeEvent(const QUuid &id) override;

private:
    std::shared_ptr<FileCalendarStorage> m_storage;
};

} // namespace data
} // namespace tempo
