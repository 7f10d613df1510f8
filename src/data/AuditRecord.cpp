#include "tempo/data/AuditRecord.hpp"

namespace tempo {
namespace data {

QString auditActionToString(AuditAction action)
{
    switch (action) {
    case AuditAction::Update:
        return QStringLiteral("UPDATE");
    case AuditAction::Delete:
        return QStringLiteral("DELETE");
    case AuditAction::Optimize:
        return QStringLiteral("OPTIMIZE");
    case AuditAction::BulkUpdate:
        return QStringLiteral("BULK_UPDATE");
    case AuditAction::BulkDelete:
        return QStringLiteral("BULK_DELETE");
    case AuditAction::Create:
    default:
        return QStringLiteral("CREATE");
    }
}

std::optional<AuditAction> auditActionFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("CREATE")) {
        return AuditAction::Create;
    }
    if (normalized == QLatin1String("UPDATE")) {
        return AuditAction::Update;
    }
    if (normalized == QLatin1String("DELETE")) {
        return AuditAction::Delete;
    }
    if (normalized == QLatin1String("OPTIMIZE")) {
        return AuditAction::Optimize;
    }
    if (normalized == QLatin1String("BULK_UPDATE")) {
        return AuditAction::BulkUpdate;
    }
    if (normalized == QLatin1String("BULK_DELETE")) {
        return AuditAction::BulkDelete;
    }
    return std::nullopt;
}

} // namespace data
} // namespace tempo
