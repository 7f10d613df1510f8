#include "tempo/data/InMemoryEventRepository.hpp"

#include <QMutexLocker>
#include <algorithm>

namespace tempo {
namespace data {

void sortChronologically(std::vector<CalendarEvent> &events)
{
    std::sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        if (lhs.start != rhs.start) {
            return lhs.start < rhs.start;
        }
        if (lhs.end != rhs.end) {
            return lhs.end < rhs.end;
        }
        return lhs.id.toString() < rhs.id.toString();
    });
}

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<CalendarEvent> InMemoryEventRepository::fetchEvents(const QString &owner, const QDateTime &from,
                                                                const QDateTime &to) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<CalendarEvent> events;
    for (const auto &event : m_events) {
        if (event.owner != owner) {
            continue;
        }
        if (event.start >= to || event.end <= from) {
            continue;
        }
        events.push_back(event);
    }
    sortChronologically(events);
    return events;
}

std::vector<CalendarEvent> InMemoryEventRepository::fetchAll(const QString &owner) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<CalendarEvent> events;
    for (const auto &event : m_events) {
        if (event.owner == owner) {
            events.push_back(event);
        }
    }
    sortChronologically(events);
    return events;
}

std::optional<CalendarEvent> InMemoryEventRepository::findById(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

std::optional<CalendarEvent> InMemoryEventRepository::addEvent(CalendarEvent event)
{
    if (!event.hasValidRange()) {
        return std::nullopt;
    }
    QMutexLocker locker(&m_mutex);
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    if (m_events.contains(event.id)) {
        return std::nullopt;
    }
    m_events.insert(event.id, event);
    return event;
}

bool InMemoryEventRepository::updateEvent(const CalendarEvent &event)
{
    if (!event.hasValidRange()) {
        return false;
    }
    QMutexLocker locker(&m_mutex);
    if (!m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryEventRepository::removeEvent(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    return m_events.remove(id) > 0;
}

} // namespace data
} // namespace tempo
