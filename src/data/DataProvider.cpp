#include "tempo/data/DataProvider.hpp"

#include "tempo/data/FileAuditLog.hpp"
#include "tempo/data/FileCalendarStorage.hpp"
#include "tempo/data/FileEventRepository.hpp"

#include <QDir>
#include <QStandardPaths>

namespace tempo {
namespace data {

DataProvider::DataProvider(const QString &storagePath)
{
    const QString filePath = storagePath.isEmpty() ? defaultStorageFile() : storagePath;

    m_calendarStorage = std::make_shared<FileCalendarStorage>(filePath);
    m_eventRepository = std::make_unique<FileEventRepository>(m_calendarStorage);
    m_auditLog = std::make_unique<FileAuditLog>(m_calendarStorage);
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

AuditLog &DataProvider::auditLog()
{
    return *m_auditLog;
}

QString DataProvider::storageFile() const
{
    return m_calendarStorage->filePath();
}

QString DataProvider::defaultStorageFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/tempo");
    }
    QDir dir(storageFolder);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("schedule.ics"));
}

} // namespace data
} // namespace tempo
