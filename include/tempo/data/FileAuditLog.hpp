#pragma once

#include "tempo/data/AuditLog.hpp"
#include "tempo/data/FileCalendarStorage.hpp"

#include <memory>

namespace tempo {
namespace data {

class FileAuditLog : public AuditLog
{
public:
    explicit FileAuditLog(std::shared_ptr<FileCalendarStorage> storage);
    ~FileAuditLog() override = default;

    std::optional<AuditRecord> append(AuditRecord record) override;
    std::vector<AuditRecord> records(const QString &owner) const override;

private:
    std::shared_ptr<FileCalendarStorage> m_storage;
};

} // namespace data
} // namespace tempo
