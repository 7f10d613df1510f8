#include "tempo/data/InMemoryAuditLog.hpp"

#include <QMutexLocker>

namespace tempo {
namespace data {

InMemoryAuditLog::InMemoryAuditLog() = default;
InMemoryAuditLog::~InMemoryAuditLog() = default;

std::optional<AuditRecord> InMemoryAuditLog::append(AuditRecord record)
{
    if (record.id.isNull()) {
        record.id = QUuid::createUuid();
    }
    if (!record.timestamp.isValid()) {
        record.timestamp = QDateTime::currentDateTimeUtc();
    }
    QMutexLocker locker(&m_mutex);
    m_records.push_back(record);
    return record;
}

std::vector<AuditRecord> InMemoryAuditLog::records(const QString &owner) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<AuditRecord> result;
    for (auto it = m_records.rbegin(); it != m_records.rend(); ++it) {
        if (it->owner == owner) {
            result.push_back(*it);
        }
    }
    return result;
}

} // namespace data
} // namespace tempo
