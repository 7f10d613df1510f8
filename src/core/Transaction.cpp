#include "tempo/core/Transaction.hpp"

#include "tempo/core/Logging.hpp"
#include "tempo/core/UndoCommand.hpp"

#include <stdexcept>

namespace tempo {
namespace core {

Transaction::Transaction(QString name)
    : m_name(std::move(name))
{
}

Transaction::~Transaction()
{
    if (m_open) {
        rollback();
    }
}

void Transaction::execute(std::unique_ptr<UndoCommand> command)
{
    if (!command) {
        return;
    }
    if (!m_open) {
        throw std::logic_error("command executed on a closed transaction");
    }
    // A command that throws from redo() has not changed anything and is not recorded.
    command->redo();
    m_commands.push_back(std::move(command));
}

void Transaction::commit()
{
    if (!m_open) {
        return;
    }
    qCDebug(lcEngine) << "unit" << m_name << "committed with" << m_commands.size() << "writes";
    m_commands.clear();
    m_open = false;
}

void Transaction::rollback()
{
    if (!m_open) {
        return;
    }
    m_open = false;
    for (auto it = m_commands.rbegin(); it != m_commands.rend(); ++it) {
        try {
            (*it)->undo();
        } catch (const std::exception &error) {
            qCCritical(lcEngine) << "unit" << m_name << "could not undo" << (*it)->describe() << ":"
                                 << error.what();
        }
    }
    qCDebug(lcEngine) << "unit" << m_name << "rolled back" << m_commands.size() << "writes";
    m_commands.clear();
}

bool Transaction::isOpen() const
{
    return m_open;
}

std::size_t Transaction::count() const
{
    return m_commands.size();
}

const QString &Transaction::name() const
{
    return m_name;
}

} // namespace core
} // namespace tempo
