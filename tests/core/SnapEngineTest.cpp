#include <QtTest/QtTest>

#include <QTimeZone>

#include "dayplan/core/SnapEngine.hpp"

using namespace dayplan;

namespace {

const QTimeZone Utc(QByteArrayLiteral("UTC"));

QDateTime at(int hour, int minute, int second = 0)
{
    return QDateTime(QDate(2024, 3, 4), QTime(hour, minute, second), Qt::UTC);
}

data::CalendarEvent meeting()
{
    data::CalendarEvent event;
    event.title = QStringLiteral("Meeting");
    event.begin = at(9, 0);
    event.end = at(10, 0);
    return event;
}

} // namespace

class SnapEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void snapsToNearestStep_data();
    void snapsToNearestStep();
    void snapPastMidnightClampsToNextDay();
    void snapFollowsDisplayZone();
    void precisionPassesThrough();
    void movePreservesDuration();
    void moveHonoursGrabOffset();
    void resizeClampsToMinimumDuration();
    void duplicateGetsFreshId();
    void createOrdersAndEnforcesMinimum();
    void invalidPointerIsRejected();
};

void SnapEngineTest::snapsToNearestStep_data()
{
    QTest::addColumn<QDateTime>("pointer");
    QTest::addColumn<QDateTime>("expected");

    QTest::newRow("10:07 rounds down") << at(10, 7) << at(10, 0);
    QTest::newRow("10:07:30 rounds half up") << at(10, 7, 30) << at(10, 15);
    QTest::newRow("10:08 rounds up") << at(10, 8) << at(10, 15);
    QTest::newRow("on grid") << at(10, 45) << at(10, 45);
}

void SnapEngineTest::snapsToNearestStep()
{
    QFETCH(QDateTime, pointer);
    QFETCH(QDateTime, expected);

    const core::SnapEngine engine(15, 60, Utc);
    QCOMPARE(engine.snap(pointer).toUTC(), expected);
}

void SnapEngineTest::snapPastMidnightClampsToNextDay()
{
    const core::SnapEngine engine(15, 60, Utc);
    const QDateTime snapped = engine.snap(at(23, 53));
    QCOMPARE(snapped.toUTC(), QDateTime(QDate(2024, 3, 5), QTime(0, 0), Qt::UTC));
}

void SnapEngineTest::snapFollowsDisplayZone()
{
    // Half-hour offset zone: the grid is anchored to local midnight, not UTC.
    const QTimeZone india(QByteArrayLiteral("Asia/Kolkata"));
    if (!india.isValid()) {
        QSKIP("Time zone database not available");
    }
    const core::SnapEngine engine(60, 60, india);
    // 04:40 UTC is 10:10 local, which rounds to 10:00 local, i.e. 04:30 UTC.
    QCOMPARE(engine.snap(at(4, 40)).toUTC(), at(4, 30));
}

void SnapEngineTest::precisionPassesThrough()
{
    const core::SnapEngine engine(15, 60, Utc);
    QCOMPARE(engine.resolve(at(10, 7, 13), core::SnapPolicy::Precision), at(10, 7, 13));
}

void SnapEngineTest::movePreservesDuration()
{
    const core::SnapEngine engine(15, 60, Utc);
    const auto proposal = engine.propose(meeting(), core::DragMode::Move, at(11, 7), core::SnapPolicy::Snap);
    QVERIFY(proposal.valid);
    QCOMPARE(proposal.begin, at(11, 0));
    QCOMPARE(proposal.end, at(12, 0));
    QVERIFY(proposal.newEventId.isNull());

    const auto precise = engine.propose(meeting(), core::DragMode::Move, at(11, 7), core::SnapPolicy::Precision);
    QCOMPARE(precise.begin, at(11, 7));
    QCOMPARE(precise.begin.secsTo(precise.end), qint64(3600));
}

void SnapEngineTest::moveHonoursGrabOffset()
{
    const core::SnapEngine engine(15, 60, Utc);
    // Grabbed 30 minutes into the event.
    const auto proposal = engine.propose(meeting(), core::DragMode::Move, at(11, 37), core::SnapPolicy::Snap, 30 * 60);
    QCOMPARE(proposal.begin, at(11, 0));
    QCOMPARE(proposal.end, at(12, 0));
}

void SnapEngineTest::resizeClampsToMinimumDuration()
{
    const core::SnapEngine engine(15, 60, Utc);

    const auto longer = engine.propose(meeting(), core::DragMode::ResizeEnd, at(10, 38), core::SnapPolicy::Snap);
    QCOMPARE(longer.begin, at(9, 0));
    QCOMPARE(longer.end, at(10, 45));

    const auto crossedEnd = engine.propose(meeting(), core::DragMode::ResizeEnd, at(8, 0), core::SnapPolicy::Snap);
    QVERIFY(crossedEnd.valid);
    QCOMPARE(crossedEnd.begin, at(9, 0));
    QCOMPARE(crossedEnd.end, at(9, 1));

    const auto crossedBegin = engine.propose(meeting(), core::DragMode::ResizeBegin, at(10, 30), core::SnapPolicy::Snap);
    QVERIFY(crossedBegin.valid);
    QCOMPARE(crossedBegin.begin, at(9, 59));
    QCOMPARE(crossedBegin.end, at(10, 0));
}

void SnapEngineTest::duplicateGetsFreshId()
{
    const core::SnapEngine engine(15, 60, Utc);
    const auto source = meeting();
    const auto proposal = engine.propose(source, core::DragMode::Duplicate, at(14, 2), core::SnapPolicy::Snap);
    QVERIFY(proposal.valid);
    QVERIFY(!proposal.newEventId.isNull());
    QVERIFY(proposal.newEventId != source.id);
    QCOMPARE(proposal.begin, at(14, 0));
    QCOMPARE(proposal.end, at(15, 0));
}

void SnapEngineTest::createOrdersAndEnforcesMinimum()
{
    const core::SnapEngine engine(15, 60, Utc);

    const auto reversed = engine.proposeCreate(at(10, 8), at(10, 2), core::SnapPolicy::Snap);
    QVERIFY(reversed.valid);
    QCOMPARE(reversed.begin, at(10, 0));
    QCOMPARE(reversed.end, at(10, 15));

    const auto tiny = engine.proposeCreate(at(10, 1), at(10, 3), core::SnapPolicy::Snap);
    QCOMPARE(tiny.begin, at(10, 0));
    QCOMPARE(tiny.end, at(10, 15));
    QVERIFY(!tiny.newEventId.isNull());
}

void SnapEngineTest::invalidPointerIsRejected()
{
    const core::SnapEngine engine(15, 60, Utc);
    QVERIFY(!engine.propose(meeting(), core::DragMode::Move, QDateTime(), core::SnapPolicy::Snap).valid);
    QVERIFY(!engine.proposeCreate(QDateTime(), at(10, 0), core::SnapPolicy::Snap).valid);
}

QTEST_APPLESS_MAIN(SnapEngineTest)
#include "SnapEngineTest.moc"
