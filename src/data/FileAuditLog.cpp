#include "tempo/data/FileAuditLog.hpp"

#include <algorithm>

namespace tempo {
namespace data {

FileAuditLog::FileAuditLog(std::shared_ptr<FileCalendarStorage> storage)
    : m_storage(std::move(storage))
{
}

std::optional<AuditRecord> FileAuditLog::append(AuditRecord record)
{
    if (!m_storage) {
        return std::nullopt;
    }
    if (record.id.isNull()) {
        record.id = QUuid::createUuid();
    }
    if (!record.timestamp.isValid()) {
        record.timestamp = QDateTime::currentDateTimeUtc();
    }
    if (!m_storage->appendAuditRecord(record)) {
        return std::nullopt;
    }
    return record;
}

std::vector<AuditRecord> FileAuditLog::records(const QString &owner) const
{
    std::vector<AuditRecord> result;
    if (!m_storage) {
        return result;
    }
    const auto all = m_storage->auditRecords();
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (it->owner == owner) {
            result.push_back(*it);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const AuditRecord &lhs, const AuditRecord &rhs) {
        return lhs.timestamp > rhs.timestamp;
    });
    return result;
}

} // namespace data
} // namespace tempo
