#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QUuid>
#include <optional>

namespace tempo {
namespace data {

enum class AuditAction
{
    Create,
    Update,
    Delete,
    Optimize,
    BulkUpdate,
    BulkDelete,
};

QString auditActionToString(AuditAction action);
std::optional<AuditAction> auditActionFromString(const QString &value);

struct AuditRecord
{
    QUuid id = QUuid::createUuid();
    QString owner;
    AuditAction action = AuditAction::Create;
    QUuid eventId; // null when the record covers several events
    QJsonObject details;
    QDateTime timestamp = QDateTime::currentDateTimeUtc();
};

} // namespace data
} // namespace tempo
