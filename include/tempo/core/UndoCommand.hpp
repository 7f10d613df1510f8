#pragma once

#include <QString>

namespace tempo {
namespace core {

class UndoCommand
{
public:
    virtual ~UndoCommand() = default;
    virtual void redo() = 0;
    virtual void undo() = 0;
    virtual QString describe() const = 0;
};

} // namespace core
} // namespace tempo
