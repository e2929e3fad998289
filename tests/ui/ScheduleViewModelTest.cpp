#include <QtTest/QtTest>

#include <QTimeZone>

#include "dayplan/core/EditHistory.hpp"
#include "dayplan/ui/viewmodels/ScheduleViewModel.hpp"

using namespace dayplan;

class ScheduleViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void loadsRange();
    void followsEdits();
};

void ScheduleViewModelTest::loadsRange()
{
    core::EditHistory history;
    const QDateTime start(QDate(2023, 1, 1), QTime(10, 0), Qt::UTC);
    const auto meeting = history.createEvent(QStringLiteral("Meeting"), start, start.addSecs(3600), QString());
    const auto overlap = history.createEvent(QStringLiteral("Call"), start.addSecs(1800), start.addSecs(5400), QString());
    QVERIFY(meeting && overlap);
    QVERIFY(history.createEvent(QStringLiteral("Outside"), start.addDays(10), start.addDays(10).addSecs(60), QString()));

    ui::ScheduleViewModel model(history, QTimeZone(QByteArrayLiteral("UTC")));
    model.setRange(QDate(2022, 12, 31), QDate(2023, 1, 2));
    model.refresh();
    QCOMPARE(model.events().size(), static_cast<size_t>(2));
    QCOMPARE(model.events().front().event.title, QStringLiteral("Meeting"));
    QCOMPARE(model.eventsOn(QDate(2023, 1, 1)).size(), static_cast<size_t>(2));
    QCOMPARE(*model.columnFor(overlap->id, QDate(2023, 1, 1)), (core::ColumnAssignment{ 1, 2 }));
    QVERIFY(!model.columnFor(overlap->id, QDate(2023, 1, 2)));
}

void ScheduleViewModelTest::followsEdits()
{
    core::EditHistory history;
    ui::ScheduleViewModel model(history, QTimeZone(QByteArrayLiteral("UTC")));
    model.setRange(QDate(2023, 1, 1), QDate(2023, 1, 1));
    connect(&history, &core::EditHistory::eventsChanged, &model, &ui::ScheduleViewModel::refresh);

    int refreshes = 0;
    connect(&model, &ui::ScheduleViewModel::eventsChanged, this, [&refreshes]() { ++refreshes; });

    const QDateTime start(QDate(2023, 1, 1), QTime(8, 0), Qt::UTC);
    QVERIFY(history.createEvent(QStringLiteral("Breakfast"), start, start.addSecs(1800), QString()));
    QCOMPARE(refreshes, 1);
    QCOMPARE(model.events().size(), static_cast<size_t>(1));

    QVERIFY(!history.undo());
    QCOMPARE(refreshes, 2);
    QVERIFY(model.events().empty());
}

QTEST_GUILESS_MAIN(ScheduleViewModelTest)
#include "ScheduleViewModelTest.moc"
