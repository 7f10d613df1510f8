#include <QtTest/QtTest>

#include "tempo/core/OwnerLocks.hpp"

class OwnerLocksTest : public QObject
{
    Q_OBJECT

private slots:
    void oneMutexPerOwner();
    void ownersDoNotContend();
};

void OwnerLocksTest::oneMutexPerOwner()
{
    tempo::core::OwnerLocks locks;
    QMutex *ada = locks.lockFor(QStringLiteral("ada"));
    QCOMPARE(locks.lockFor(QStringLiteral("ada")), ada);
    QVERIFY(locks.lockFor(QStringLiteral("bob")) != ada);
    QCOMPARE(locks.size(), 2);
}

void OwnerLocksTest::ownersDoNotContend()
{
    tempo::core::OwnerLocks locks;
    QMutexLocker adaLocker(locks.lockFor(QStringLiteral("ada")));
    QVERIFY(locks.lockFor(QStringLiteral("bob"))->tryLock());
    locks.lockFor(QStringLiteral("bob"))->unlock();
    QVERIFY(!locks.lockFor(QStringLiteral("ada"))->tryLock());
}

QTEST_MAIN(OwnerLocksTest)
#include "OwnerLocksTest.moc"
