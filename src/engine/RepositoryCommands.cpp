#include "tempo/engine/RepositoryCommands.hpp"

#include "tempo/core/Errors.hpp"
#include "tempo/core/Logging.hpp"
#include "tempo/data/EventRepository.hpp"

#include <QObject>

namespace tempo {
namespace engine {

AddEventCommand::AddEventCommand(data::EventRepository &repository, data::CalendarEvent event)
    : m_repository(repository)
    , m_event(std::move(event))
{
}

void AddEventCommand::redo()
{
    auto stored = m_repository.addEvent(m_event);
    if (!stored) {
        throw core::PersistenceError(QObject::tr("Could not store event \"%1\"").arg(m_event.title));
    }
    m_event = *stored;
}

void AddEventCommand::undo()
{
    if (!m_repository.removeEvent(m_event.id)) {
        qCWarning(lcEngine) << "undo of" << describe() << "found nothing to remove";
    }
}

QString AddEventCommand::describe() const
{
    return QStringLiteral("add %1").arg(m_event.id.toString(QUuid::WithoutBraces));
}

UpdateEventCommand::UpdateEventCommand(data::EventRepository &repository, data::CalendarEvent updated)
    : m_repository(repository)
    , m_updated(std::move(updated))
{
}

void UpdateEventCommand::redo()
{
    m_previous = m_repository.findById(m_updated.id);
    if (!m_previous) {
        throw core::PersistenceError(QObject::tr("Event \"%1\" no longer exists").arg(m_updated.title));
    }
    if (!m_repository.updateEvent(m_updated)) {
        throw core::PersistenceError(QObject::tr("Could not update event \"%1\"").arg(m_updated.title));
    }
}

void UpdateEventCommand::undo()
{
    if (m_previous && !m_repository.updateEvent(*m_previous)) {
        qCWarning(lcEngine) << "undo of" << describe() << "was refused";
    }
}

QString UpdateEventCommand::describe() const
{
    return QStringLiteral("update %1").arg(m_updated.id.toString(QUuid::WithoutBraces));
}

RemoveEventCommand::RemoveEventCommand(data::EventRepository &repository, QUuid id)
    : m_repository(repository)
    , m_id(id)
{
}

void RemoveEventCommand::redo()
{
    m_removed = m_repository.findById(m_id);
    if (!m_removed || !m_repository.removeEvent(m_id)) {
        m_removed.reset();
        throw core::PersistenceError(
            QObject::tr("Could not remove event %1").arg(m_id.toString(QUuid::WithoutBraces)));
    }
}

void RemoveEventCommand::undo()
{
    if (m_removed && !m_repository.addEvent(*m_removed)) {
        qCWarning(lcEngine) << "undo of" << describe() << "was refused";
    }
}

QString RemoveEventCommand::describe() const
{
    return QStringLiteral("remove %1").arg(m_id.toString(QUuid::WithoutBraces));
}

} // namespace engine
} // namespace tempo
