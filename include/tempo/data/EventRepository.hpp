#pragma once

#include <optional>
#include <vector>

#include "tempo/data/Event.hpp"

namespace tempo {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Events of owner intersecting [from, to), ordered by start.
    virtual std::vector<CalendarEvent> fetchEvents(const QString &owner, const QDateTime &from,
                                                   const QDateTime &to) const = 0;
    virtual std::vector<CalendarEvent> fetchAll(const QString &owner) const = 0;
    virtual std::optional<CalendarEvent> findById(const QUuid &id) const = 0;
    // Refuses an invalid range or an id that is already stored.
    virtual std::optional<CalendarEvent> addEvent(CalendarEvent event) = 0;
    virtual bool updateEvent(const CalendarEvent &event) = 0;
    virtual bool removeEvent(const QUuid &id) = 0;
};

void sortChronologically(std::vector<CalendarEvent> &events);

} // namespace data
} // namespace tempo
