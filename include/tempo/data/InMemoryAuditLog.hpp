#pragma once

#include <QMutex>
#include <vector>

#include "tempo/data/AuditLog.hpp"

namespace tempo {
namespace data {

class InMemoryAuditLog : public AuditLog
{
public:
    InMemoryAuditLog();
    ~InMemoryAuditLog() override;

    std::optional<AuditRecord> append(AuditRecord record) override;
    std::vector<AuditRecord> records(const QString &owner) const override;

private:
    mutable QMutex m_mutex;
    std::vector<AuditRecord> m_records;
};

} // namespace data
} // namespace tempo
