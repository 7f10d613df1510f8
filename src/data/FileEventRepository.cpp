#include "tempo/data/FileEventRepository.hpp"

namespace tempo {
namespace data {

FileEventRepository::FileEventRepository(std::shared_ptr<FileCalendarStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<CalendarEvent> FileEventRepository::fetchEvents(const QString &owner, const QDateTime &from,
                                                            const QDateTime &to) const
{
    std::vector<CalendarEvent> result;
    if (!m_storage) {
        return result;
    }

    const auto events = m_storage->events();
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        const auto &event = it.value();
        if (event.owner != owner || event.start >= to || event.end <= from) {
            continue;
        }
        result.push_back(event);
    }
    sortChronologically(result);
    return result;
}

std::vector<CalendarEvent> FileEventRepository::fetchAll(const QString &owner) const
{
    std::vector<CalendarEvent> result;
    if (!m_storage) {
        return result;
    }

    const auto events = m_storage->events();
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        if (it.value().owner == owner) {
            result.push_back(it.value());
        }
    }
    sortChronologically(result);
    return result;
}

std::optional<CalendarEvent> FileEventRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto events = m_storage->events();
    if (events.contains(id)) {
        return events.value(id);
    }
    return std::nullopt;
}

std::optional<CalendarEvent> FileEventRepository::addEvent(CalendarEvent event)
{
    if (!m_storage || !event.hasValidRange()) {
        return std::nullopt;
    }
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    if (!m_storage->insertEvent(event)) {
        return std::nullopt;
    }
    return event;
}

bool FileEventRepository::updateEvent(const CalendarEvent &event)
{
    if (!m_storage || !event.hasValidRange()) {
        return false;
    }
    return m_storage->replaceEvent(event);
}

bool FileEventRepository::removeEvent(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeEvent(id);
}

} // namespace data
} // namespace tempo
