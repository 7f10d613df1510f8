#pragma once

#include <QString>
#include <stdexcept>

namespace tempo {
namespace core {

class SchedulingError : public std::runtime_error
{
public:
    explicit SchedulingError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }

    QString message() const { return QString::fromStdString(what()); }
};

// Rejected input; raised before anything is written.
class ValidationError : public SchedulingError
{
public:
    using SchedulingError::SchedulingError;
};

// A repository refused or failed a write inside an atomic unit.
class PersistenceError : public SchedulingError
{
public:
    using SchedulingError::SchedulingError;
};

// A fixed event cannot take its requested slot.
class ConflictError : public SchedulingError
{
public:
    using SchedulingError::SchedulingError;
};

} // namespace core
} // namespace tempo
