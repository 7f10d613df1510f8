#pragma once

#include <QUuid>
#include <optional>

#include "tempo/core/UndoCommand.hpp"
#include "tempo/data/Event.hpp"

namespace tempo {
namespace data {
class EventRepository;
}

namespace engine {

// Repository writes as undoable steps of a core::Transaction. redo() throws
// core::PersistenceError when the repository refuses the write.

class AddEventCommand : public core::UndoCommand
{
public:
    AddEventCommand(data::EventRepository &repository, data::CalendarEvent event);

    void redo() override;
    void undo() override;
    QString describe() const override;

private:
    data::EventRepository &m_repository;
    data::CalendarEvent m_event;
};

class UpdateEventCommand : public core::UndoCommand
{
public:
    UpdateEventCommand(data::EventRepository &repository, data::CalendarEvent updated);

    void redo() override;
    void undo() override;
    QString describe() const override;

private:
    data::EventRepository &m_repository;
    data::CalendarEvent m_updated;
    std::optional<data::CalendarEvent> m_previous;
};

class RemoveEventCommand : public core::UndoCommand
{
public:
    RemoveEventCommand(data::EventRepository &repository, QUuid id);

    void redo() override;
    void undo() override;
    QString describe() const override;

private:
    data::EventRepository &m_repository;
    QUuid m_id;
    std::optional<data::CalendarEvent> m_removed;
};

} // namespace engine
} // namespace tempo
