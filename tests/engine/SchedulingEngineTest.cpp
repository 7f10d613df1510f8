#include <QtTest/QtTest>

#include "tempo/core/Errors.hpp"
#include "tempo/data/InMemoryAuditLog.hpp"
#include "tempo/data/InMemoryEventRepository.hpp"
#include "tempo/engine/ConflictDetector.hpp"
#include "tempo/engine/SchedulingEngine.hpp"

#include <QJsonArray>
#include <QSignalSpy>

using namespace tempo;

namespace {
const QString OWNER = QStringLiteral("ada");

QDateTime jan(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 1, day), QTime(hour, minute), Qt::UTC);
}

data::CalendarEvent makeEvent(const QString &title, const QString &category, const QDateTime &start, int minutes,
                              bool flexible = true)
{
    data::CalendarEvent event;
    event.owner = OWNER;
    event.title = title;
    event.category = category;
    event.start = start;
    event.end = start.addSecs(minutes * 60);
    event.flexible = flexible;
    return event;
}

// Refuses the n-th call to updateEvent (1-based), counting undo writes too.
class FailingEventRepository : public data::InMemoryEventRepository
{
public:
    int failOnUpdate = -1;
    int updates = 0;

    bool updateEvent(const data::CalendarEvent &event) override
    {
        ++updates;
        if (updates == failOnUpdate) {
            return false;
        }
        return InMemoryEventRepository::updateEvent(event);
    }
};

class RefusingAuditLog : public data::AuditLog
{
public:
    std::optional<data::AuditRecord> append(data::AuditRecord) override { return std::nullopt; }
    std::vector<data::AuditRecord> records(const QString &) const override { return {}; }
};
} // namespace

class SchedulingEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void scheduleEventStoresAuditsAndNotifies();
    void scheduleEventMovesLowerPriorityOccupant();
    void fixedEventThatLosesIsRejected();
    void invalidEventsAreRejectedBeforeWriting();
    void updateAndDelete();
    void queryFiltersByCategoryAndPriority();
    void optimizeResolvesWindow();
    void optimizeEmptyWindowWritesNothing();
    void examStudySessions();
    void failedWriteRollsBackWholeUnit();
    void bulkUpdateOfMissingEventRollsBack();
    void bulkUpdateRejectsForeignEvents();
    void bulkUpdateCannotClaimStoredForeignEvent();
    void bulkDeleteSkipsForeignAndMissing();
    void refusedAuditRollsBackEvents();
};

void SchedulingEngineTest::scheduleEventStoresAuditsAndNotifies()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto event = makeEvent("Gym", "Gym", jan(2, 7), 60);
    const auto result = engine.scheduleEvent(event);

    QCOMPARE(result.events.size(), static_cast<size_t>(1));
    QVERIFY(repository.findById(event.id).has_value());

    const auto records = auditLog.records(OWNER);
    QCOMPARE(records.size(), static_cast<size_t>(1));
    QVERIFY(records.front().action == data::AuditAction::Create);
    QCOMPARE(records.front().eventId, event.id);
    QCOMPARE(records.front().details.value(QStringLiteral("title")).toString(), QStringLiteral("Gym"));

    QCOMPARE(spy.count(), 1);
    const auto notice = spy.at(0).at(0).value<engine::CommitNotice>();
    QCOMPARE(notice.owner, OWNER);
    QCOMPARE(notice.saved.size(), static_cast<size_t>(1));
    QVERIFY(notice.removed.empty());
}

void SchedulingEngineTest::scheduleEventMovesLowerPriorityOccupant()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    const auto gaming = makeEvent("Gaming", "Gaming", jan(4, 18), 120);
    const auto later = makeEvent("Dinner", "Social", jan(4, 20), 60);
    engine.scheduleEvent(gaming);
    engine.scheduleEvent(later);

    const auto study = makeEvent("Study", "Study", jan(4, 18), 120);
    const auto result = engine.scheduleEvent(study);

    QVERIFY(result.wasMoved(gaming.id));
    QCOMPARE(repository.findById(study.id)->start, jan(4, 18));
    // The dinner outside the contested slot still blocks 20:00-21:00.
    QCOMPARE(repository.findById(gaming.id)->start, jan(4, 21));
    QCOMPARE(repository.findById(gaming.id)->end, jan(4, 23));
    QVERIFY(engine::detectConflicts(repository.fetchAll(OWNER)).empty());

    const auto records = auditLog.records(OWNER);
    QCOMPARE(records.size(), static_cast<size_t>(3));
    const auto moved = records.front().details.value(QStringLiteral("moved_ids")).toArray();
    QCOMPARE(moved.size(), 1);
    QCOMPARE(moved.at(0).toString(), gaming.id.toString(QUuid::WithoutBraces));
}

void SchedulingEngineTest::fixedEventThatLosesIsRejected()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    const auto exam = makeEvent("Exam", "Exam", jan(5, 10), 60);
    engine.scheduleEvent(exam);
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto gym = makeEvent("Class", "Gym", jan(5, 10, 30), 60, false);
    QVERIFY_EXCEPTION_THROWN(engine.scheduleEvent(gym), core::ConflictError);

    QVERIFY(!repository.findById(gym.id).has_value());
    QCOMPARE(repository.findById(exam.id)->start, jan(5, 10));
    QCOMPARE(auditLog.records(OWNER).size(), static_cast<size_t>(1));
    QCOMPARE(spy.count(), 0);
}

void SchedulingEngineTest::invalidEventsAreRejectedBeforeWriting()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    auto backwards = makeEvent("Backwards", "Gym", jan(2, 10), 60);
    backwards.end = backwards.start.addSecs(-60);
    QVERIFY_EXCEPTION_THROWN(engine.scheduleEvent(backwards), core::ValidationError);

    const auto unknown = makeEvent("Knitting", "Crafts", jan(2, 10), 60);
    QVERIFY_EXCEPTION_THROWN(engine.scheduleEvent(unknown), core::ValidationError);

    auto ownerless = makeEvent("Nobody", "Gym", jan(2, 10), 60);
    ownerless.owner.clear();
    QVERIFY_EXCEPTION_THROWN(engine.scheduleEvent(ownerless), core::ValidationError);

    const auto twice = makeEvent("Twice", "Gym", jan(2, 12), 60);
    engine.scheduleEvent(twice);
    QVERIFY_EXCEPTION_THROWN(engine.scheduleEvent(twice), core::ValidationError);

    QCOMPARE(repository.fetchAll(OWNER).size(), static_cast<size_t>(1));
    QCOMPARE(auditLog.records(OWNER).size(), static_cast<size_t>(1));
}

void SchedulingEngineTest::updateAndDelete()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    auto event = makeEvent("Coffee", "Social", jan(3, 9), 30);
    engine.scheduleEvent(event);

    event.title = QStringLiteral("Coffee with Sam");
    event.start = jan(3, 10);
    event.end = jan(3, 11);
    engine.updateEvent(event);
    QCOMPARE(repository.findById(event.id)->title, QStringLiteral("Coffee with Sam"));

    auto records = auditLog.records(OWNER);
    QVERIFY(records.front().action == data::AuditAction::Update);
    QCOMPARE(records.front().details.value(QStringLiteral("previous_start")).toString(),
             jan(3, 9).toString(Qt::ISODate));

    auto stranger = event;
    stranger.owner = QStringLiteral("bob");
    QVERIFY_EXCEPTION_THROWN(engine.updateEvent(stranger), core::ValidationError);

    QVERIFY(!engine.deleteEvent(QStringLiteral("bob"), event.id));
    QVERIFY(engine.deleteEvent(OWNER, event.id));
    QVERIFY(!repository.findById(event.id).has_value());
    QVERIFY(!engine.deleteEvent(OWNER, event.id));

    records = auditLog.records(OWNER);
    QCOMPARE(records.size(), static_cast<size_t>(3));
    QVERIFY(records.front().action == data::AuditAction::Delete);
    QCOMPARE(records.front().details.value(QStringLiteral("title")).toString(), QStringLiteral("Coffee with Sam"));

    QCOMPARE(spy.count(), 3);
    const auto notice = spy.at(2).at(0).value<engine::CommitNotice>();
    QCOMPARE(notice.removed.size(), static_cast<size_t>(1));
    QCOMPARE(notice.removed.front().id, event.id);
}

void SchedulingEngineTest::queryFiltersByCategoryAndPriority()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    engine.scheduleEvent(makeEvent("Quiz", "Exam", jan(8, 9), 60));
    engine.scheduleEvent(makeEvent("Run", "Gym", jan(8, 11), 60));
    engine.scheduleEvent(makeEvent("Raid", "Gaming", jan(8, 20), 60));
    engine.scheduleEvent(makeEvent("Next day", "Gym", jan(9, 11), 60));

    engine::EventQuery query;
    query.owner = OWNER;
    query.window = { jan(8, 0), jan(9, 0) };
    QCOMPARE(engine.queryEvents(query).size(), static_cast<size_t>(3));

    query.minimumPriority = 3;
    const auto important = engine.queryEvents(query);
    QCOMPARE(important.size(), static_cast<size_t>(2));
    QCOMPARE(important.front().title, QStringLiteral("Quiz"));

    query.minimumPriority = 0;
    query.category = QStringLiteral("gym");
    const auto gym = engine.queryEvents(query);
    QCOMPARE(gym.size(), static_cast<size_t>(1));
    QCOMPARE(gym.front().title, QStringLiteral("Run"));

    query.window = { jan(9, 0), jan(8, 0) };
    QVERIFY_EXCEPTION_THROWN(engine.queryEvents(query), core::ValidationError);
}

void SchedulingEngineTest::optimizeResolvesWindow()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    // Written behind the engine's back, so they still overlap.
    const auto social = *repository.addEvent(makeEvent("Party", "Social", jan(6, 19), 120));
    const auto gym = *repository.addEvent(makeEvent("Gym", "Gym", jan(6, 20), 60));
    const auto outside = *repository.addEvent(makeEvent("Brunch", "Social", jan(7, 10), 60));
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto result = engine.optimize(OWNER, { jan(6, 0), jan(7, 0) });

    QCOMPARE(result.events.size(), static_cast<size_t>(2));
    QVERIFY(result.wasMoved(social.id));
    QCOMPARE(repository.findById(gym.id)->start, jan(6, 20));
    QCOMPARE(repository.findById(social.id)->start, jan(6, 21));
    QCOMPARE(repository.findById(social.id)->end, jan(6, 23));
    QCOMPARE(repository.findById(outside.id)->start, jan(7, 10));

    const auto records = auditLog.records(OWNER);
    QCOMPARE(records.size(), static_cast<size_t>(1));
    QVERIFY(records.front().action == data::AuditAction::Optimize);
    QVERIFY(records.front().eventId.isNull());
    QCOMPARE(records.front().details.value(QStringLiteral("num_events")).toInt(), 2);
    QCOMPARE(records.front().details.value(QStringLiteral("event_ids")).toArray().size(), 2);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<engine::CommitNotice>().saved.size(), static_cast<size_t>(1));
}

void SchedulingEngineTest::optimizeEmptyWindowWritesNothing()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto result = engine.optimize(OWNER, { jan(6, 0), jan(7, 0) });

    QVERIFY(result.events.empty());
    QVERIFY(auditLog.records(OWNER).empty());
    QCOMPARE(spy.count(), 0);
    QVERIFY_EXCEPTION_THROWN(engine.optimize(OWNER, { jan(7, 0), jan(6, 0) }), core::ValidationError);
}

void SchedulingEngineTest::examStudySessions()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    // Five days after 7 January.
    const auto exam = makeEvent("Calculus Final", "Exam", jan(12, 9), 180, false);
    const auto gaming = makeEvent("Gaming", "Gaming", jan(10, 14), 120);
    engine.scheduleEvent(exam);
    engine.scheduleEvent(gaming);
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto sessions = engine.createExamStudySessions(exam, 3, 120);

    QCOMPARE(sessions.size(), static_cast<size_t>(3));
    for (const auto &session : sessions) {
        QCOMPARE(session.category, QStringLiteral("Study"));
        QVERIFY(session.end < exam.start);
        QVERIFY(session.title.contains(exam.title));
        QCOMPARE(repository.findById(session.id)->start, session.start);
    }
    QCOMPARE(sessions.at(1).start, jan(10, 14));
    QCOMPARE(repository.findById(gaming.id)->start, jan(10, 16));
    QCOMPARE(repository.fetchAll(OWNER).size(), static_cast<size_t>(5));

    const auto records = auditLog.records(OWNER);
    QVERIFY(records.front().action == data::AuditAction::Create);
    QCOMPARE(records.front().eventId, exam.id);
    QCOMPARE(records.front().details.value(QStringLiteral("study_session_ids")).toArray().size(), 3);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<engine::CommitNotice>().saved.size(), static_cast<size_t>(4));

    auto notAnExam = gaming;
    QVERIFY_EXCEPTION_THROWN(engine.createExamStudySessions(notAnExam), core::ValidationError);
}

void SchedulingEngineTest::failedWriteRollsBackWholeUnit()
{
    FailingEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    const auto first = *repository.addEvent(makeEvent("First", "Gym", jan(2, 8), 60));
    const auto second = *repository.addEvent(makeEvent("Second", "Gym", jan(2, 10), 60));
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    auto movedFirst = first;
    movedFirst.start = jan(3, 8);
    movedFirst.end = jan(3, 9);
    auto movedSecond = second;
    movedSecond.start = jan(3, 10);
    movedSecond.end = jan(3, 11);

    repository.failOnUpdate = 2;
    QVERIFY_EXCEPTION_THROWN(engine.bulkUpdate(OWNER, { movedFirst, movedSecond }), core::PersistenceError);

    QCOMPARE(repository.findById(first.id)->start, jan(2, 8));
    QCOMPARE(repository.findById(second.id)->start, jan(2, 10));
    QVERIFY(auditLog.records(OWNER).empty());
    QCOMPARE(spy.count(), 0);
}

void SchedulingEngineTest::bulkUpdateOfMissingEventRollsBack()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    const auto stored = *repository.addEvent(makeEvent("Stored", "Study", jan(2, 8), 60));
    auto renamed = stored;
    renamed.title = QStringLiteral("Renamed");
    const auto ghost = makeEvent("Ghost", "Study", jan(2, 12), 60);

    QVERIFY_EXCEPTION_THROWN(engine.bulkUpdate(OWNER, { renamed, ghost }), core::PersistenceError);
    QCOMPARE(repository.findById(stored.id)->title, QStringLiteral("Stored"));
    QVERIFY(auditLog.records(OWNER).empty());

    const auto updated = engine.bulkUpdate(OWNER, { renamed });
    QCOMPARE(updated.size(), static_cast<size_t>(1));
    QCOMPARE(repository.findById(stored.id)->title, QStringLiteral("Renamed"));
    const auto records = auditLog.records(OWNER);
    QCOMPARE(records.size(), static_cast<size_t>(1));
    QVERIFY(records.front().action == data::AuditAction::BulkUpdate);

    QVERIFY(engine.bulkUpdate(OWNER, {}).empty());
    QCOMPARE(auditLog.records(OWNER).size(), static_cast<size_t>(1));
}

void SchedulingEngineTest::bulkUpdateRejectsForeignEvents()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    auto foreign = *repository.addEvent(makeEvent("Foreign", "Gym", jan(2, 8), 60));
    foreign.owner = QStringLiteral("bob");
    QVERIFY_EXCEPTION_THROWN(engine.bulkUpdate(OWNER, { foreign }), core::ValidationError);

    auto broken = foreign;
    broken.owner = OWNER;
    broken.end = broken.start;
    QVERIFY_EXCEPTION_THROWN(engine.bulkUpdate(OWNER, { broken }), core::ValidationError);
    QVERIFY(auditLog.records(OWNER).empty());
}

void SchedulingEngineTest::bulkUpdateCannotClaimStoredForeignEvent()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto own = *repository.addEvent(makeEvent("Own", "Gym", jan(2, 8), 60));
    auto bobsEvent = makeEvent("Bob's run", "Gym", jan(2, 10), 60);
    bobsEvent.owner = QStringLiteral("bob");
    const auto stored = *repository.addEvent(bobsEvent);

    auto movedOwn = own;
    movedOwn.start = jan(2, 12);
    movedOwn.end = movedOwn.start.addSecs(3600);
    auto claimed = stored;
    claimed.owner = OWNER;
    claimed.start = jan(3, 10);
    claimed.end = claimed.start.addSecs(3600);
    QVERIFY_EXCEPTION_THROWN(engine.bulkUpdate(OWNER, { movedOwn, claimed }), core::ValidationError);

    const auto bobs = repository.findById(stored.id);
    QVERIFY(bobs.has_value());
    QCOMPARE(bobs->owner, QStringLiteral("bob"));
    QCOMPARE(bobs->start, stored.start);
    QCOMPARE(repository.findById(own.id)->start, own.start);
    QVERIFY(auditLog.records(OWNER).empty());
    QVERIFY(auditLog.records(QStringLiteral("bob")).empty());
    QCOMPARE(spy.count(), 0);
}

void SchedulingEngineTest::bulkDeleteSkipsForeignAndMissing()
{
    data::InMemoryEventRepository repository;
    data::InMemoryAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());
    QSignalSpy spy(&engine, &engine::SchedulingEngine::changesCommitted);

    const auto a = *repository.addEvent(makeEvent("A", "Gym", jan(2, 8), 60));
    const auto b = *repository.addEvent(makeEvent("B", "Gym", jan(2, 10), 60));
    auto foreignEvent = makeEvent("C", "Gym", jan(2, 12), 60);
    foreignEvent.owner = QStringLiteral("bob");
    const auto c = *repository.addEvent(foreignEvent);

    const int removed = engine.bulkDelete(OWNER, { a.id, b.id, c.id, QUuid::createUuid(), a.id });

    QCOMPARE(removed, 2);
    QVERIFY(!repository.findById(a.id).has_value());
    QVERIFY(!repository.findById(b.id).has_value());
    QVERIFY(repository.findById(c.id).has_value());

    const auto records = auditLog.records(OWNER);
    QCOMPARE(records.size(), static_cast<size_t>(1));
    QVERIFY(records.front().action == data::AuditAction::BulkDelete);
    QCOMPARE(records.front().details.value(QStringLiteral("num_events")).toInt(), 2);
    QCOMPARE(records.front().details.value(QStringLiteral("deleted_events")).toArray().size(), 2);
    QCOMPARE(spy.count(), 1);

    QCOMPARE(engine.bulkDelete(OWNER, {}), 0);
    QCOMPARE(engine.bulkDelete(OWNER, { c.id }), 0);
    QCOMPARE(auditLog.records(OWNER).size(), static_cast<size_t>(1));
}

void SchedulingEngineTest::refusedAuditRollsBackEvents()
{
    data::InMemoryEventRepository repository;
    RefusingAuditLog auditLog;
    engine::SchedulingEngine engine(repository, auditLog, core::SchedulerSettings());

    const auto gaming = *repository.addEvent(makeEvent("Gaming", "Gaming", jan(4, 18), 120));
    const auto study = makeEvent("Study", "Study", jan(4, 18), 120);

    QVERIFY_EXCEPTION_THROWN(engine.scheduleEvent(study), core::PersistenceError);
    QVERIFY(!repository.findById(study.id).has_value());
    QCOMPARE(repository.findById(gaming.id)->start, jan(4, 18));
}

QTEST_MAIN(SchedulingEngineTest)
#include "SchedulingEngineTest.moc"
