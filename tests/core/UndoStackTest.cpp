#include <QtTest/QtTest>

#include "dayplan/core/EditCommand.hpp"
#include "dayplan/core/UndoStack.hpp"

using namespace dayplan;

namespace {

core::EditCommand createCommand(const QString &title)
{
    data::CalendarEvent event;
    event.title = title;
    event.begin = QDateTime(QDate(2024, 3, 4), QTime(9, 0), Qt::UTC);
    event.end = event.begin.addSecs(3600);
    return core::EditCommand::create(event);
}

} // namespace

class UndoStackTest : public QObject
{
    Q_OBJECT

private slots:
    void pushUndoRedo();
    void pushClearsRedo();
    void respectsLimit();
    void invertedSwapsStates();
};

void UndoStackTest::pushUndoRedo()
{
    core::UndoStack stack;
    const auto command = createCommand(QStringLiteral("Standup"));
    stack.push(command);
    QVERIFY(stack.canUndo());
    QVERIFY(!stack.canRedo());

    const auto undone = stack.undo();
    QVERIFY(undone.has_value());
    QCOMPARE(undone->eventId(), command.eventId());
    QVERIFY(!stack.canUndo());
    QVERIFY(stack.canRedo());

    const auto redone = stack.redo();
    QVERIFY(redone.has_value());
    QCOMPARE(redone->eventId(), command.eventId());
    QCOMPARE(stack.undoCount(), static_cast<std::size_t>(1));
    QCOMPARE(stack.redoCount(), static_cast<std::size_t>(0));

    QVERIFY(!stack.redo().has_value());
}

void UndoStackTest::pushClearsRedo()
{
    core::UndoStack stack;
    stack.push(createCommand(QStringLiteral("one")));
    stack.push(createCommand(QStringLiteral("two")));
    QVERIFY(stack.undo().has_value());
    QCOMPARE(stack.redoCount(), static_cast<std::size_t>(1));

    stack.push(createCommand(QStringLiteral("three")));
    QVERIFY(!stack.canRedo());
    QCOMPARE(stack.undoCount(), static_cast<std::size_t>(2));
}

void UndoStackTest::respectsLimit()
{
    core::UndoStack stack(2);
    const auto first = createCommand(QStringLiteral("first"));
    stack.push(first);
    stack.push(createCommand(QStringLiteral("second")));
    stack.push(createCommand(QStringLiteral("third"))); // first cmd dropped
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));

    QVERIFY(stack.undo().has_value());
    const auto oldest = stack.undo();
    QVERIFY(oldest.has_value());
    QVERIFY(oldest->eventId() != first.eventId());
    QVERIFY(!stack.undo().has_value());
}

void UndoStackTest::invertedSwapsStates()
{
    const auto command = createCommand(QStringLiteral("Lunch"));
    const auto inverse = command.inverted();
    QVERIFY(!inverse.after().has_value());
    QVERIFY(inverse.before().has_value());
    QCOMPARE(inverse.before()->title, QStringLiteral("Lunch"));
    QCOMPARE(inverse.eventId(), command.eventId());
}

QTEST_APPLESS_MAIN(UndoStackTest)
#include "UndoStackTest.moc"
