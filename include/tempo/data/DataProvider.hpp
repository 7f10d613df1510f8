#pragma once

#include <memory>
#include <QString>

namespace tempo {
namespace data {

class EventRepository;
class AuditLog;
class FileCalendarStorage;

// File-backed repositories sharing one calendar file. Tests build the in-memory ones directly.
class DataProvider
{
public:
    explicit DataProvider(const QString &storagePath = QString());
    ~DataProvider();

    EventRepository &eventRepository();
    AuditLog &auditLog();
    QString storageFile() const;

    static QString defaultStorageFile();

private:
    std::shared_ptr<FileCalendarStorage> m_calendarStorage;
    std::unique_ptr<EventRepository> m_eventRepository;
    std::unique_ptr<AuditLog> m_auditLog;
};

} // namespace data
} // namespace tempo
