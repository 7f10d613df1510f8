#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>
#include <QUuid>
#include <functional>
#include <optional>
#include <vector>

#include "tempo/core/OwnerLocks.hpp"
#include "tempo/core/SchedulerSettings.hpp"
#include "tempo/data/AuditRecord.hpp"
#include "tempo/data/Event.hpp"
#include "tempo/data/TimeRange.hpp"
#include "tempo/engine/ConflictResolver.hpp"

namespace tempo {
namespace core {
class Transaction;
}
namespace data {
class AuditLog;
class EventRepository;
}

namespace engine {

// Published once per committed unit.
struct CommitNotice
{
    QString owner;
    data::AuditAction action = data::AuditAction::Create;
    std::vector<data::CalendarEvent> saved;
    std::vector<data::CalendarEvent> removed;
};

struct EventQuery
{
    QString owner;
    data::TimeRange window;
    QString category; // empty: any
    int minimumPriority = 0;
};

// The only component writing events. Every mutation runs under the owner's
// lock as one all-or-nothing unit that ends with exactly one audit record.
// A failing unit is rolled back and the error is rethrown.
class SchedulingEngine : public QObject
{
    Q_OBJECT

public:
    SchedulingEngine(data::EventRepository &events, data::AuditLog &auditLog, core::SchedulerSettings settings,
                     QObject *parent = nullptr);
    ~SchedulingEngine() override;

    const core::SchedulerSettings &settings() const;
    const data::CategoryTable &categories() const;

    // Inserts event and moves lower priority occupants of its slot. A fixed
    // event that cannot win its slot throws core::ConflictError.
    ResolutionResult scheduleEvent(data::CalendarEvent event);
    data::CalendarEvent updateEvent(const data::CalendarEvent &event);
    bool deleteEvent(const QString &owner, const QUuid &id);
    std::vector<data::CalendarEvent> queryEvents(const EventQuery &query) const;

    ResolutionResult optimize(const QString &owner, const data::TimeRange &window);
    std::vector<data::CalendarEvent> createExamStudySessions(const data::CalendarEvent &exam);
    std::vector<data::CalendarEvent> createExamStudySessions(const data::CalendarEvent &exam, int count,
                                                             int durationMinutes);
    std::vector<data::CalendarEvent> bulkUpdate(const QString &owner, const std::vector<data::CalendarEvent> &events);
    int bulkDelete(const QString &owner, const std::vector<QUuid> &ids);

signals:
    void changesCommitted(const tempo::engine::CommitNotice &notice);

private:
    void runUnit(const QString &operation, const QString &owner, const std::function<void(core::Transaction &)> &body);
    void validateEvent(const data::CalendarEvent &event) const;
    void recordAudit(data::AuditRecord record);
    std::vector<data::CalendarEvent> resolutionContext(const QString &owner, const data::TimeRange &window) const;
    void writeChanges(core::Transaction &unit, const ResolutionResult &result,
                      const std::vector<data::CalendarEvent> &before, std::vector<data::CalendarEvent> &saved);

    data::EventRepository &m_events;
    data::AuditLog &m_auditLog;
    core::SchedulerSettings m_settings;
    core::OwnerLocks m_locks;
};

} // namespace engine
} // namespace tempo

Q_DECLARE_METATYPE(tempo::engine::CommitNotice)
