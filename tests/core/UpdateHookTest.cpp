#include <QtTest/QtTest>

#include <QSignalSpy>

#include "dayplan/core/UpdateHook.hpp"

using namespace dayplan;

class UpdateHookTest : public QObject
{
    Q_OBJECT

private slots:
    void disabledWithoutCommand();
    void coalescesRepeatedChanges();
    void reportsStartFailure();
};

void UpdateHookTest::disabledWithoutCommand()
{
    core::UpdateHook hook;
    QSignalSpy triggered(&hook, &core::UpdateHook::triggered);
    hook.schedule();
    QVERIFY(!hook.isEnabled());
    QVERIFY(!hook.isPending());
    hook.runNow();
    QCOMPARE(triggered.count(), 0);
}

void UpdateHookTest::coalescesRepeatedChanges()
{
    core::UpdateHook hook;
    hook.setCommand({ QStringLiteral("true") });
    hook.setDelay(50);
    QSignalSpy triggered(&hook, &core::UpdateHook::triggered);

    hook.schedule();
    hook.schedule();
    hook.schedule();
    QVERIFY(hook.isPending());

    QTRY_COMPARE(triggered.count(), 1);
    QVERIFY(!hook.isPending());
    QTest::qWait(150);
    QCOMPARE(triggered.count(), 1);
}

void UpdateHookTest::reportsStartFailure()
{
    core::UpdateHook hook;
    hook.setCommand({ QStringLiteral("/nonexistent/dayplan-hook") });
    hook.setDelay(0);
    QSignalSpy failed(&hook, &core::UpdateHook::startFailed);
    hook.schedule();
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(failed.first().first().toString(), QStringLiteral("/nonexistent/dayplan-hook"));
}

QTEST_GUILESS_MAIN(UpdateHookTest)
#include "UpdateHookTest.moc"
