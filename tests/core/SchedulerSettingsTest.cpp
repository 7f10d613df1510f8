#include <QtTest/QtTest>

#include "tempo/core/Errors.hpp"
#include "tempo/core/SchedulerSettings.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace tempo;

class SchedulerSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsAreValid();
    void saveAndLoad();
    void loadsCustomHierarchy();
    void rejectsInvalidValues();
};

void SchedulerSettingsTest::defaultsAreValid()
{
    core::SchedulerSettings settings;
    settings.validate();
    QCOMPARE(settings.searchHorizonDays, 30);
    QCOMPARE(settings.studySessionCount, 3);
    QCOMPARE(settings.studySessionMinutes, 120);
    QCOMPARE(settings.studySessionHour, 14);
    QCOMPARE(settings.categories.priorityOf(QStringLiteral("Exam")), 5);
    QVERIFY(settings.timeZone().isValid());
}

void SchedulerSettingsTest::saveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tempo.ini"));

    core::SchedulerSettings original;
    original.timeZoneId = QStringLiteral("Europe/Vienna");
    original.studySessionCount = 2;
    original.studySessionHour = 10;
    original.storagePath = dir.filePath(QStringLiteral("schedule.ics"));
    {
        QSettings store(path, QSettings::IniFormat);
        original.save(store);
    }

    QSettings store(path, QSettings::IniFormat);
    const auto loaded = core::SchedulerSettings::load(store);
    QCOMPARE(loaded.timeZoneId, QStringLiteral("Europe/Vienna"));
    QCOMPARE(loaded.studySessionCount, 2);
    QCOMPARE(loaded.studySessionHour, 10);
    QCOMPARE(loaded.storagePath, original.storagePath);
    QCOMPARE(loaded.categories.categories().size(), static_cast<size_t>(5));
}

void SchedulerSettingsTest::loadsCustomHierarchy()
{
    QTemporaryDir dir;
    QSettings store(dir.filePath(QStringLiteral("custom.ini")), QSettings::IniFormat);
    store.beginGroup(QStringLiteral("scheduler"));
    store.beginWriteArray(QStringLiteral("categories"));
    const QStringList names{ QStringLiteral("Study"), QStringLiteral("Exam"), QStringLiteral("Chores") };
    const QList<int> priorities{ 10, 20, 1 };
    for (int i = 0; i < names.size(); ++i) {
        store.setArrayIndex(i);
        store.setValue(QStringLiteral("name"), names.at(i));
        store.setValue(QStringLiteral("priority"), priorities.at(i));
    }
    store.endArray();
    store.endGroup();

    const auto loaded = core::SchedulerSettings::load(store);
    QCOMPARE(loaded.categories.categories().front().name, QStringLiteral("Exam"));
    QCOMPARE(loaded.categories.priorityOf(QStringLiteral("chores")), 1);
    QVERIFY(!loaded.categories.contains(QStringLiteral("Gaming")));
}

void SchedulerSettingsTest::rejectsInvalidValues()
{
    core::SchedulerSettings zone;
    zone.timeZoneId = QStringLiteral("Mars/Olympus_Mons");
    QVERIFY_EXCEPTION_THROWN(zone.validate(), core::ValidationError);

    core::SchedulerSettings horizon;
    horizon.searchHorizonDays = 0;
    QVERIFY_EXCEPTION_THROWN(horizon.validate(), core::ValidationError);

    core::SchedulerSettings sessions;
    sessions.studySessionCount = 0;
    QVERIFY_EXCEPTION_THROWN(sessions.validate(), core::ValidationError);

    core::SchedulerSettings hour;
    hour.studySessionHour = 24;
    QVERIFY_EXCEPTION_THROWN(hour.validate(), core::ValidationError);

    core::SchedulerSettings category;
    category.studyCategory = QStringLiteral("Napping");
    QVERIFY_EXCEPTION_THROWN(category.validate(), core::ValidationError);
}

QTEST_MAIN(SchedulerSettingsTest)
#include "SchedulerSettingsTest.moc"
