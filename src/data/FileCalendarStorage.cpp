#include "tempo/data/FileCalendarStorage.hpp"

#include "tempo/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

namespace tempo {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value.trimmed());
    return QUuid(withBraces);
}

bool parseFlag(const QString &value)
{
    return value.trimmed().compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
}
} // namespace

FileCalendarStorage::FileCalendarStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

QHash<QUuid, CalendarEvent> FileCalendarStorage::events() const
{
    QMutexLocker locker(&m_mutex);
    return m_events;
}

std::vector<AuditRecord> FileCalendarStorage::auditRecords() const
{
    QMutexLocker locker(&m_mutex);
    return m_auditRecords;
}

bool FileCalendarStorage::insertEvent(const CalendarEvent &event)
{
    QMutexLocker locker(&m_mutex);
    if (event.id.isNull() || m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    if (!save()) {
        m_events.remove(event.id);
        return false;
    }
    return true;
}

bool FileCalendarStorage::replaceEvent(const CalendarEvent &event)
{
    QMutexLocker locker(&m_mutex);
    if (!m_events.contains(event.id)) {
        return false;
    }
    const CalendarEvent previous = m_events.value(event.id);
    m_events.insert(event.id, event);
    if (!save()) {
        m_events.insert(previous.id, previous);
        return false;
    }
    return true;
}

bool FileCalendarStorage::removeEvent(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    if (!m_events.contains(id)) {
        return false;
    }
    const CalendarEvent previous = m_events.take(id);
    if (!save()) {
        m_events.insert(previous.id, previous);
        return false;
    }
    return true;
}

bool FileCalendarStorage::appendAuditRecord(const AuditRecord &record)
{
    QMutexLocker locker(&m_mutex);
    m_auditRecords.push_back(record);
    if (!save()) {
        m_auditRecords.pop_back();
        return false;
    }
    return true;
}

const QString &FileCalendarStorage::filePath() const
{
    return m_filePath;
}

void FileCalendarStorage::load()
{
    m_events.clear();
    m_auditRecords.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcData) << "cannot read calendar file" << m_filePath << ":" << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Event,
        Journal
    };

    Section currentSection = Section::None;
    CalendarEvent currentEvent;
    AuditRecord currentRecord;

    auto finalizeEvent = [&]() {
        if (currentEvent.id.isNull() || !currentEvent.hasValidRange()) {
            qCWarning(lcData) << "skipping malformed event" << currentEvent.title << "in" << m_filePath;
            return;
        }
        m_events.insert(currentEvent.id, currentEvent);
    };

    auto finalizeRecord = [&]() {
        if (currentRecord.id.isNull()) {
            currentRecord.id = QUuid::createUuid();
        }
        m_auditRecords.push_back(currentRecord);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Event;
            currentEvent = CalendarEvent{};
            currentEvent.id = QUuid();
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeEvent();
            currentSection = Section::None;
            return;
        }
        if (line == QLatin1String("BEGIN:VJOURNAL")) {
            currentSection = Section::Journal;
            currentRecord = AuditRecord{};
            currentRecord.id = QUuid();
            return;
        }
        if (line == QLatin1String("END:VJOURNAL")) {
            finalizeRecord();
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString name = line.left(colonIndex).section(';', 0, 0).toUpper();
        const QString rawValue = line.mid(colonIndex + 1);
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Event) {
            if (name == QLatin1String("UID")) {
                currentEvent.id = parseUid(value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentEvent.title = value;
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentEvent.description = value;
            } else if (name == QLatin1String("DTSTART")) {
                currentEvent.start = parseDateTime(rawValue);
            } else if (name == QLatin1String("DTEND")) {
                currentEvent.end = parseDateTime(rawValue);
            } else if (name == QLatin1String("CATEGORIES")) {
                currentEvent.category = value.trimmed();
            } else if (name == QLatin1String("STATUS")) {
                currentEvent.completed = rawValue.trimmed().compare(QLatin1String("COMPLETED"), Qt::CaseInsensitive) == 0;
            } else if (name == QLatin1String("X-TEMPO-OWNER")) {
                currentEvent.owner = value;
            } else if (name == QLatin1String("X-TEMPO-FLEXIBLE")) {
                currentEvent.flexible = parseFlag(rawValue);
            } else if (name == QLatin1String("X-TEMPO-EXTERNAL-ID")) {
                currentEvent.externalId = value;
            }
            return;
        }

        if (name == QLatin1String("UID")) {
            currentRecord.id = parseUid(value);
        } else if (name == QLatin1String("X-TEMPO-OWNER")) {
            currentRecord.owner = value;
        } else if (name == QLatin1String("X-TEMPO-ACTION")) {
            currentRecord.action = auditActionFromString(rawValue).value_or(AuditAction::Create);
        } else if (name == QLatin1String("RELATED-TO")) {
            currentRecord.eventId = parseUid(value);
        } else if (name == QLatin1String("DTSTAMP")) {
            currentRecord.timestamp = parseDateTime(rawValue);
        } else if (name == QLatin1String("DESCRIPTION")) {
            currentRecord.details = QJsonDocument::fromJson(value.toUtf8()).object();
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
    qCDebug(lcData) << "loaded" << m_events.size() << "events and" << m_auditRecords.size() << "audit records from"
                    << m_filePath;
}

bool FileCalendarStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcData) << "cannot write calendar file" << m_filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Tempo//Priority Scheduler//EN\n";

    auto events = m_events.values();
    std::sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        return lhs.start < rhs.start;
    });
    for (const CalendarEvent &event : events) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << prepareUid(event.id) << '\n';
        stream << "SUMMARY:" << encodeText(event.title) << '\n';
        if (!event.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(event.description) << '\n';
        }
        stream << "DTSTART:" << formatDateTime(event.start) << '\n';
        stream << "DTEND:" << formatDateTime(event.end) << '\n';
        if (!event.category.isEmpty()) {
            stream << "CATEGORIES:" << encodeText(event.category) << '\n';
        }
        if (event.completed) {
            stream << "STATUS:COMPLETED\n";
        }
        stream << "X-TEMPO-OWNER:" << encodeText(event.owner) << '\n';
        stream << "X-TEMPO-FLEXIBLE:" << (event.flexible ? "TRUE" : "FALSE") << '\n';
        if (!event.externalId.isEmpty()) {
            stream << "X-TEMPO-EXTERNAL-ID:" << encodeText(event.externalId) << '\n';
        }
        stream << "END:VEVENT\n";
    }

    for (const AuditRecord &record : m_auditRecords) {
        stream << "BEGIN:VJOURNAL\n";
        stream << "UID:" << prepareUid(record.id) << '\n';
        stream << "DTSTAMP:" << formatDateTime(record.timestamp) << '\n';
        stream << "X-TEMPO-OWNER:" << encodeText(record.owner) << '\n';
        stream << "X-TEMPO-ACTION:" << auditActionToString(record.action) << '\n';
        if (!record.eventId.isNull()) {
            stream << "RELATED-TO:" << prepareUid(record.eventId) << '\n';
        }
        const QByteArray json = QJsonDocument(record.details).toJson(QJsonDocument::Compact);
        stream << "DESCRIPTION:" << encodeText(QString::fromUtf8(json)) << '\n';
        stream << "END:VJOURNAL\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (stream.status() != QTextStream::Ok || !file.commit()) {
        qCWarning(lcData) << "flushing calendar file" << m_filePath << "failed:" << file.errorString();
        return false;
    }
    return true;
}

QString FileCalendarStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileCalendarStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != '\\' || i + 1 == text.size()) {
            decoded.append(c);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded.append('\n');
        } else {
            decoded.append(next);
        }
    }
    return decoded;
}

QString FileCalendarStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileCalendarStorage::parseDateTime(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(trimmed, DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    QDateTime dt = QDateTime::fromString(trimmed, "yyyyMMdd'T'hhmmss");
    if (!dt.isValid()) {
        dt = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    return dt;
}

} // namespace data
} // namespace tempo
