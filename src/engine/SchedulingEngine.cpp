#include "tempo/engine/SchedulingEngine.hpp"

#include "tempo/core/Errors.hpp"
#include "tempo/core/Logging.hpp"
#include "tempo/core/Transaction.hpp"
#include "tempo/data/AuditLog.hpp"
#include "tempo/data/EventRepository.hpp"
#include "tempo/engine/RepositoryCommands.hpp"
#include "tempo/engine/StudySessionGenerator.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSet>
#include <algorithm>

namespace tempo {
namespace engine {

namespace {
QJsonArray idArray(const std::vector<QUuid> &ids)
{
    QJsonArray array;
    for (const auto &id : ids) {
        array.append(id.toString(QUuid::WithoutBraces));
    }
    return array;
}

QJsonArray idArray(const std::vector<data::CalendarEvent> &events)
{
    QJsonArray array;
    for (const auto &event : events) {
        array.append(event.id.toString(QUuid::WithoutBraces));
    }
    return array;
}

QJsonObject eventSummary(const data::CalendarEvent &event)
{
    QJsonObject summary;
    summary.insert(QStringLiteral("id"), event.id.toString(QUuid::WithoutBraces));
    summary.insert(QStringLiteral("title"), event.title);
    summary.insert(QStringLiteral("category"), event.category);
    summary.insert(QStringLiteral("start"), event.start.toString(Qt::ISODate));
    summary.insert(QStringLiteral("end"), event.end.toString(Qt::ISODate));
    return summary;
}

// Smallest range covering all events.
data::TimeRange spanOf(const std::vector<data::CalendarEvent> &events)
{
    data::TimeRange span;
    for (const auto &event : events) {
        if (!span.start.isValid() || event.start < span.start) {
            span.start = event.start;
        }
        if (!span.end.isValid() || event.end > span.end) {
            span.end = event.end;
        }
    }
    return span;
}

const data::CalendarEvent *findIn(const std::vector<data::CalendarEvent> &events, const QUuid &id)
{
    auto it = std::find_if(events.begin(), events.end(), [&id](const data::CalendarEvent &event) {
        return event.id == id;
    });
    return it == events.end() ? nullptr : &*it;
}
} // namespace

SchedulingEngine::SchedulingEngine(data::EventRepository &events, data::AuditLog &auditLog,
                                   core::SchedulerSettings settings, QObject *parent)
    : QObject(parent)
    , m_events(events)
    , m_auditLog(auditLog)
    , m_settings(std::move(settings))
{
    qRegisterMetaType<tempo::engine::CommitNotice>();
    m_settings.validate();
}

SchedulingEngine::~SchedulingEngine() = default;

const core::SchedulerSettings &SchedulingEngine::settings() const
{
    return m_settings;
}

const data::CategoryTable &SchedulingEngine::categories() const
{
    return m_settings.categories;
}

ResolutionResult SchedulingEngine::scheduleEvent(data::CalendarEvent event)
{
    validateEvent(event);
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }

    ResolutionResult result;
    CommitNotice notice{ event.owner, data::AuditAction::Create, {}, {} };
    runUnit(QStringLiteral("schedule_event"), event.owner, [&](core::Transaction &unit) {
        if (m_events.findById(event.id)) {
            throw core::ValidationError(tr("Event \"%1\" is already scheduled").arg(event.title));
        }

        std::vector<data::CalendarEvent> candidates = m_events.fetchEvents(event.owner, event.start, event.end);
        const std::vector<data::CalendarEvent> occupants = candidates;
        candidates.push_back(event);

        result = resolveConflicts(candidates, categories(), m_settings.searchHorizonDays,
                                  resolutionContext(event.owner, spanOf(candidates)));
        if (!event.flexible && result.isUnresolved(event.id)) {
            throw core::ConflictError(tr("Fixed event \"%1\" overlaps a more important event").arg(event.title));
        }

        const data::CalendarEvent *placed = findIn(result.events, event.id);
        unit.execute(std::make_unique<AddEventCommand>(m_events, *placed));
        notice.saved.push_back(*placed);
        writeChanges(unit, result, occupants, notice.saved);

        data::AuditRecord record;
        record.owner = event.owner;
        record.action = data::AuditAction::Create;
        record.eventId = placed->id;
        QJsonObject details = eventSummary(*placed);
        details.insert(QStringLiteral("moved_ids"), idArray(result.moved));
        details.insert(QStringLiteral("unresolved_ids"), idArray(result.unresolved));
        record.details = details;
        recordAudit(record);
    });

    emit changesCommitted(notice);
    return result;
}

data::CalendarEvent SchedulingEngine::updateEvent(const data::CalendarEvent &event)
{
    validateEvent(event);

    runUnit(QStringLiteral("update_event"), event.owner, [&](core::Transaction &unit) {
        const auto existing = m_events.findById(event.id);
        if (!existing || existing->owner != event.owner) {
            throw core::ValidationError(tr("Unknown event \"%1\"").arg(event.title));
        }
        unit.execute(std::make_unique<UpdateEventCommand>(m_events, event));

        data::AuditRecord record;
        record.owner = event.owner;
        record.action = data::AuditAction::Update;
        record.eventId = event.id;
        QJsonObject details = eventSummary(event);
        details.insert(QStringLiteral("previous_start"), existing->start.toString(Qt::ISODate));
        details.insert(QStringLiteral("previous_end"), existing->end.toString(Qt::ISODate));
        record.details = details;
        recordAudit(record);
    });

    emit changesCommitted(CommitNotice{ event.owner, data::AuditAction::Update, { event }, {} });
    return event;
}

bool SchedulingEngine::deleteEvent(const QString &owner, const QUuid &id)
{
    std::optional<data::CalendarEvent> removed;
    runUnit(QStringLiteral("delete_event"), owner, [&](core::Transaction &unit) {
        const auto existing = m_events.findById(id);
        if (!existing || existing->owner != owner) {
            return;
        }
        unit.execute(std::make_unique<RemoveEventCommand>(m_events, id));

        data::AuditRecord record;
        record.owner = owner;
        record.action = data::AuditAction::Delete;
        record.eventId = id;
        record.details = eventSummary(*existing);
        recordAudit(record);
        removed = existing;
    });

    if (!removed) {
        qCDebug(lcEngine) << "nothing to delete for" << owner << id;
        return false;
    }
    emit changesCommitted(CommitNotice{ owner, data::AuditAction::Delete, {}, { *removed } });
    return true;
}

std::vector<data::CalendarEvent> SchedulingEngine::queryEvents(const EventQuery &query) const
{
    if (!query.window.isValid()) {
        throw core::ValidationError(tr("Query window must end after it starts"));
    }
    auto events = m_events.fetchEvents(query.owner, query.window.start, query.window.end);
    events.erase(std::remove_if(events.begin(), events.end(),
                                [this, &query](const data::CalendarEvent &event) {
                                    if (!query.category.isEmpty()
                                        && event.category.compare(query.category, Qt::CaseInsensitive) != 0) {
                                        return true;
                                    }
                                    return categories().priorityOf(event.category) < query.minimumPriority;
                                }),
                 events.end());
    return events;
}

ResolutionResult SchedulingEngine::optimize(const QString &owner, const data::TimeRange &window)
{
    if (!window.isValid()) {
        throw core::ValidationError(tr("Optimization window must end after it starts"));
    }

    ResolutionResult result;
    CommitNotice notice{ owner, data::AuditAction::Optimize, {}, {} };
    bool audited = false;
    runUnit(QStringLiteral("optimize"), owner, [&](core::Transaction &unit) {
        const auto events = m_events.fetchEvents(owner, window.start, window.end);
        if (events.empty()) {
            return;
        }

        data::TimeRange span = spanOf(events);
        span.start = std::min(span.start, window.start);
        span.end = std::max(span.end, window.end);
        result = resolveConflicts(events, categories(), m_settings.searchHorizonDays, resolutionContext(owner, span));
        writeChanges(unit, result, events, notice.saved);

        data::AuditRecord record;
        record.owner = owner;
        record.action = data::AuditAction::Optimize;
        QJsonObject details;
        details.insert(QStringLiteral("start_date"), window.start.toString(Qt::ISODate));
        details.insert(QStringLiteral("end_date"), window.end.toString(Qt::ISODate));
        details.insert(QStringLiteral("num_events"), static_cast<int>(result.events.size()));
        details.insert(QStringLiteral("event_ids"), idArray(result.events));
        details.insert(QStringLiteral("moved_ids"), idArray(result.moved));
        details.insert(QStringLiteral("unresolved_ids"), idArray(result.unresolved));
        record.details = details;
        recordAudit(record);
        audited = true;
    });

    if (audited) {
        emit changesCommitted(notice);
    }
    return result;
}

std::vector<data::CalendarEvent> SchedulingEngine::createExamStudySessions(const data::CalendarEvent &exam)
{
    return createExamStudySessions(exam, m_settings.studySessionCount, m_settings.studySessionMinutes);
}

std::vector<data::CalendarEvent> SchedulingEngine::createExamStudySessions(const data::CalendarEvent &exam, int count,
                                                                           int durationMinutes)
{
    if (exam.owner.isEmpty()) {
        throw core::ValidationError(tr("Exam \"%1\" has no owner").arg(exam.title));
    }
    const StudySessionGenerator generator(m_settings);
    std::vector<data::CalendarEvent> sessions = generator.generate(exam, count, durationMinutes);

    CommitNotice notice{ exam.owner, data::AuditAction::Create, {}, {} };
    runUnit(QStringLiteral("create_exam_study_sessions"), exam.owner, [&](core::Transaction &unit) {
        for (const auto &session : sessions) {
            unit.execute(std::make_unique<AddEventCommand>(m_events, session));
        }

        const data::TimeRange span = spanOf(sessions);
        const auto affected = m_events.fetchEvents(exam.owner, span.start, span.end);
        const ResolutionResult result = resolveConflicts(affected, categories(), m_settings.searchHorizonDays,
                                                         resolutionContext(exam.owner, spanOf(affected)));
        std::vector<data::CalendarEvent> moved;
        writeChanges(unit, result, affected, moved);

        for (auto &session : sessions) {
            if (const data::CalendarEvent *resolved = findIn(result.events, session.id)) {
                session = *resolved;
            }
        }
        notice.saved = sessions;
        for (const auto &event : moved) {
            if (!findIn(sessions, event.id)) {
                notice.saved.push_back(event);
            }
        }

        data::AuditRecord record;
        record.owner = exam.owner;
        record.action = data::AuditAction::Create;
        record.eventId = exam.id;
        QJsonObject details;
        details.insert(QStringLiteral("action_type"), QStringLiteral("exam_study_sessions"));
        details.insert(QStringLiteral("exam_title"), exam.title);
        details.insert(QStringLiteral("num_sessions"), static_cast<int>(sessions.size()));
        details.insert(QStringLiteral("study_session_ids"), idArray(sessions));
        details.insert(QStringLiteral("moved_ids"), idArray(result.moved));
        details.insert(QStringLiteral("unresolved_ids"), idArray(result.unresolved));
        record.details = details;
        recordAudit(record);
    });

    emit changesCommitted(notice);
    return sessions;
}

std::vector<data::CalendarEvent> SchedulingEngine::bulkUpdate(const QString &owner,
                                                              const std::vector<data::CalendarEvent> &events)
{
    if (events.empty()) {
        return {};
    }
    for (const auto &event : events) {
        validateEvent(event);
        if (event.owner != owner) {
            throw core::ValidationError(tr("Event \"%1\" belongs to another owner").arg(event.title));
        }
    }

    runUnit(QStringLiteral("bulk_update"), owner, [&](core::Transaction &unit) {
        for (const auto &event : events) {
            // A missing target is left to the command, which raises PersistenceError.
            const auto stored = m_events.findById(event.id);
            if (stored && stored->owner != owner) {
                throw core::ValidationError(tr("Event \"%1\" belongs to another owner").arg(stored->title));
            }
            unit.execute(std::make_unique<UpdateEventCommand>(m_events, event));
        }

        data::AuditRecord record;
        record.owner = owner;
        record.action = data::AuditAction::BulkUpdate;
        QJsonObject details;
        details.insert(QStringLiteral("operation"), QStringLiteral("bulk_update"));
        details.insert(QStringLiteral("num_events"), static_cast<int>(events.size()));
        details.insert(QStringLiteral("event_ids"), idArray(events));
        record.details = details;
        recordAudit(record);
    });

    emit changesCommitted(CommitNotice{ owner, data::AuditAction::BulkUpdate, events, {} });
    return events;
}

int SchedulingEngine::bulkDelete(const QString &owner, const std::vector<QUuid> &ids)
{
    if (ids.empty()) {
        return 0;
    }

    std::vector<data::CalendarEvent> removed;
    runUnit(QStringLiteral("bulk_delete"), owner, [&](core::Transaction &unit) {
        QSet<QUuid> seen;
        for (const auto &id : ids) {
            if (seen.contains(id)) {
                continue;
            }
            seen.insert(id);
            const auto existing = m_events.findById(id);
            if (!existing || existing->owner != owner) {
                continue;
            }
            unit.execute(std::make_unique<RemoveEventCommand>(m_events, id));
            removed.push_back(*existing);
        }
        if (removed.empty()) {
            return;
        }

        QJsonArray deleted;
        for (const auto &event : removed) {
            deleted.append(eventSummary(event));
        }
        data::AuditRecord record;
        record.owner = owner;
        record.action = data::AuditAction::BulkDelete;
        QJsonObject details;
        details.insert(QStringLiteral("operation"), QStringLiteral("bulk_delete"));
        details.insert(QStringLiteral("num_events"), static_cast<int>(removed.size()));
        details.insert(QStringLiteral("deleted_events"), deleted);
        record.details = details;
        recordAudit(record);
    });

    if (!removed.empty()) {
        emit changesCommitted(CommitNotice{ owner, data::AuditAction::BulkDelete, {}, removed });
    }
    return static_cast<int>(removed.size());
}

void SchedulingEngine::runUnit(const QString &operation, const QString &owner,
                               const std::function<void(core::Transaction &)> &body)
{
    QMutexLocker locker(m_locks.lockFor(owner));
    core::Transaction unit(operation);
    try {
        body(unit);
        unit.commit();
    } catch (const std::exception &error) {
        qCWarning(lcEngine) << operation << "failed for" << owner << ":" << error.what();
        unit.rollback();
        throw;
    }
    qCInfo(lcEngine) << operation << "committed for" << owner;
}

void SchedulingEngine::validateEvent(const data::CalendarEvent &event) const
{
    if (event.owner.isEmpty()) {
        throw core::ValidationError(tr("Event \"%1\" has no owner").arg(event.title));
    }
    if (!event.hasValidRange()) {
        throw core::ValidationError(tr("Event \"%1\" must end after it starts").arg(event.title));
    }
    if (!categories().contains(event.category)) {
        throw core::ValidationError(tr("Unknown category \"%1\"").arg(event.category));
    }
}

void SchedulingEngine::recordAudit(data::AuditRecord record)
{
    if (!m_auditLog.append(std::move(record))) {
        throw core::PersistenceError(tr("Audit record could not be written"));
    }
}

std::vector<data::CalendarEvent> SchedulingEngine::resolutionContext(const QString &owner,
                                                                     const data::TimeRange &window) const
{
    return m_events.fetchEvents(owner, window.start, window.end.addDays(m_settings.searchHorizonDays));
}

void SchedulingEngine::writeChanges(core::Transaction &unit, const ResolutionResult &result,
                                    const std::vector<data::CalendarEvent> &before,
                                    std::vector<data::CalendarEvent> &saved)
{
    for (const auto &event : result.events) {
        const data::CalendarEvent *original = findIn(before, event.id);
        if (!original || (original->start == event.start && original->end == event.end)) {
            continue;
        }
        unit.execute(std::make_unique<UpdateEventCommand>(m_events, event));
        saved.push_back(event);
    }
}

} // namespace engine
} // namespace tempo
