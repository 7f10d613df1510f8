#pragma once

#include <optional>
#include <vector>

#include "tempo/data/AuditRecord.hpp"

namespace tempo {
namespace data {

// Append-only store of audit records.
class AuditLog
{
public:
    virtual ~AuditLog() = default;

    virtual std::optional<AuditRecord> append(AuditRecord record) = 0;
    // Newest first.
    virtual std::vector<AuditRecord> records(const QString &owner) const = 0;
};

} // namespace data
} // namespace tempo
