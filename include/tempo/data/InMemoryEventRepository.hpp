#pragma once

#include <QHash>
#include <QMutex>

#include "tempo/data/EventRepository.hpp"

namespace tempo {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<CalendarEvent> fetchEvents(const QString &owner, const QDateTime &from,
                                           const QDateTime &to) const override;
    std::vector<CalendarEvent> fetchAll(const QString &owner) const override;
    std::optional<CalendarEvent> findById(const QUuid &id) const override;
    std::optional<CalendarEvent> addEvent(CalendarEvent event) override;
    bool updateEvent(const CalendarEvent &event) override;
    bool removeEvent(const QUuid &id) override;

private:
    mutable QMutex m_mutex;
    QHash<QUuid, CalendarEvent> m_events;
};

} // namespace data
} // namespace tempo
