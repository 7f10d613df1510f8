#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QUuid>
#include <vector>

#include "tempo/data/AuditRecord.hpp"
#include "tempo/data/Event.hpp"

namespace tempo {
namespace data {

// iCalendar file holding events (VEVENT) and the audit trail (VJOURNAL).
// Every write is flushed through QSaveFile; a write that cannot be flushed is
// reverted in memory and reported as failed.
class FileCalendarStorage
{
public:
    explicit FileCalendarStorage(QString filePath);
    ~FileCalendarStorage() = default;

    QHash<QUuid, CalendarEvent> events() const;
    std::vector<AuditRecord> auditRecords() const;

    bool insertEvent(const CalendarEvent &event);
    bool replaceEvent(const CalendarEvent &event);
    bool removeEvent(const QUuid &id);
    bool appendAuditRecord(const AuditRecord &record);

    const QString &filePath() const;

private:
    void load();
    bool save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

    QString m_filePath;
    mutable QMutex m_mutex;
    QHash<QUuid, CalendarEvent> m_events;
    std::vector<AuditRecord> m_auditRecords;
};

} // namespace data
} // namespace tempo
