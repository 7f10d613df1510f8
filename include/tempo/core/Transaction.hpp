#pragma once

#include <QString>
#include <cstddef>
#include <memory>
#include <vector>

namespace tempo {
namespace core {

class UndoCommand;

// All-or-nothing unit of work. Every executed command is undone in reverse
// order unless commit() is reached; destruction of an open unit rolls back.
class Transaction
{
public:
    explicit Transaction(QString name);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void execute(std::unique_ptr<UndoCommand> command);
    void commit();
    void rollback();

    bool isOpen() const;
    std::size_t count() const;
    const QString &name() const;

private:
    QString m_name;
    std::vector<std::unique_ptr<UndoCommand>> m_commands;
    bool m_open = true;
};

} // namespace core
} // namespace tempo
