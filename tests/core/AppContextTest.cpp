#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "dayplan/core/AppContext.hpp"
#include "dayplan/core/EditHistory.hpp"
#include "dayplan/core/UpdateHook.hpp"
#include "dayplan/notify/NotificationScheduler.hpp"
#include "dayplan/notify/Notifier.hpp"

using namespace dayplan;

namespace {

QDateTime at(int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 3, 4), QTime(hour, minute), Qt::UTC);
}

class SilentNotifier : public notify::Notifier
{
public:
    void notify(const QString &, const QString &, const QDateTime &) override {}
};

} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void dragEditAndUndoRoundTrip();
    void duplicateCreatesNewEvent();
    void committingProposalTwiceIsRejected();
    void foreignCalendarNameIsKept();
    void unreadableCalendarIsNotOverwritten();
    void reopenSeesPersistedEvents();
    void hookRunsAfterWrites();
    void schedulerReceivesSnapshots();

private:
    core::Settings makeSettings() const;
    std::unique_ptr<core::AppContext> makeContext() const;

    std::unique_ptr<QTemporaryDir> m_dir;
};

void AppContextTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void AppContextTest::cleanup()
{
    m_dir.reset();
}

core::Settings AppContextTest::makeSettings() const
{
    core::Settings settings;
    settings.calendarDirectory = m_dir->filePath(QStringLiteral("calendars"));
    settings.cachePath = m_dir->filePath(QStringLiteral("cache.sqlite"));
    settings.displayTimeZone = QStringLiteral("UTC");
    settings.defaultGroup = QStringLiteral("work");
    return settings;
}

std::unique_ptr<core::AppContext> AppContextTest::makeContext() const
{
    return std::make_unique<core::AppContext>(makeSettings(), std::make_unique<SilentNotifier>());
}

void AppContextTest::dragEditAndUndoRoundTrip()
{
    auto context = makeContext();
    QVERIFY(!context->open().hasErrors());

    const auto create = context->proposeCreate(at(9, 2), at(9, 58), core::SnapPolicy::Snap);
    QVERIFY(!context->commitCreate(QStringLiteral("Focus"), create));
    const QUuid id = create.newEventId;
    QCOMPARE(context->history().findById(id)->begin, at(9));
    QCOMPARE(context->history().findById(id)->group, QStringLiteral("work"));

    const auto move = context->proposeDrag(id, at(13, 7), core::DragMode::Move, core::SnapPolicy::Snap);
    QVERIFY(move.valid);
    QVERIFY(!context->commitDrag(id, core::DragMode::Move, move));

    auto placed = context->eventsInRange(at(0), at(23, 59));
    QCOMPARE(placed.size(), static_cast<std::size_t>(1));
    QCOMPARE(placed.front().event.begin, at(13));
    QCOMPARE(placed.front().event.end, at(14));

    QVERIFY(!context->undo());
    placed = context->eventsInRange(at(0), at(23, 59));
    QCOMPARE(placed.front().event.begin, at(9));
    QVERIFY(!context->redo());
    QVERIFY(context->eventsInRange(at(9), at(10)).empty());

    const auto unknown = context->proposeDrag(QUuid::createUuid(), at(10), core::DragMode::Move, core::SnapPolicy::Snap);
    QVERIFY(!unknown.valid);
    QCOMPARE(context->commitDrag(QUuid::createUuid(), core::DragMode::Move, move)->code, core::ErrorCode::NotFound);
}

void AppContextTest::duplicateCreatesNewEvent()
{
    auto context = makeContext();
    QVERIFY(!context->open().hasErrors());
    const auto source = context->history().createEvent(QStringLiteral("Lecture"), at(10), at(11), QStringLiteral("uni"));
    QVERIFY(source);

    const auto copy = context->proposeDrag(source->id, at(15), core::DragMode::Duplicate, core::SnapPolicy::Snap);
    QVERIFY(!context->commitDrag(source->id, core::DragMode::Duplicate, copy));
    QCOMPARE(context->history().count(), static_cast<std::size_t>(2));
    const auto duplicate = context->history().findById(copy.newEventId);
    QVERIFY(duplicate);
    QCOMPARE(duplicate->title, QStringLiteral("Lecture"));
    QCOMPARE(duplicate->group, QStringLiteral("uni"));
    QCOMPARE(duplicate->begin, at(15));
    QCOMPARE(context->history().findById(source->id)->begin, at(10));
}

void AppContextTest::committingProposalTwiceIsRejected()
{
    auto context = makeContext();
    QVERIFY(!context->open().hasErrors());
    const auto create = context->proposeCreate(at(9), at(10), core::SnapPolicy::Snap);
    QVERIFY(!context->commitCreate(QStringLiteral("First"), create));

    const auto again = context->commitCreate(QStringLiteral("Second"), create);
    QVERIFY(again);
    QCOMPARE(again->code, core::ErrorCode::DuplicateId);
    QCOMPARE(context->history().findById(create.newEventId)->title, QStringLiteral("First"));

    const auto copy = context->proposeDrag(create.newEventId, at(15), core::DragMode::Duplicate, core::SnapPolicy::Snap);
    QVERIFY(!context->commitDrag(create.newEventId, core::DragMode::Duplicate, copy));
    QCOMPARE(context->commitDrag(create.newEventId, core::DragMode::Duplicate, copy)->code, core::ErrorCode::DuplicateId);
    QCOMPARE(context->history().count(), static_cast<std::size_t>(2));

    QVERIFY(!context->undo());
    QVERIFY(!context->undo());
    QCOMPARE(context->history().count(), static_cast<std::size_t>(0));
}

void AppContextTest::foreignCalendarNameIsKept()
{
    const QString directory = makeSettings().calendarDirectory;
    QVERIFY(QDir().mkpath(directory));
    const QString path = QDir(directory).absoluteFilePath(QStringLiteral("Team (A).ics"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("BEGIN:VCALENDAR\r\n"
               "BEGIN:VEVENT\r\n"
               "UID:team-sync@example.com\r\n"
               "SUMMARY:Team sync\r\n"
               "DTSTART:20240304T090000Z\r\n"
               "DTEND:20240304T100000Z\r\n"
               "END:VEVENT\r\n"
               "END:VCALENDAR\r\n");
    file.close();

    auto context = makeContext();
    const auto report = context->open();
    QVERIFY(!report.hasErrors());
    QCOMPARE(report.events.size(), static_cast<std::size_t>(1));
    const QUuid id = report.events.front().id;

    data::EventPatch patch;
    patch.title = QStringLiteral("Team sync (moved)");
    QVERIFY(!context->history().updateEvent(id, patch));
    QCOMPARE(QDir(directory).entryList({ QStringLiteral("*.ics") }, QDir::Files),
             QStringList{ QStringLiteral("Team (A).ics") });
    QCOMPARE(context->refresh().events.front().title, QStringLiteral("Team sync (moved)"));

    QVERIFY(!context->history().deleteEvent(id));
    QVERIFY(!QFile::exists(path));
    QVERIFY(context->refresh().events.empty());
}

void AppContextTest::unreadableCalendarIsNotOverwritten()
{
    auto context = makeContext();
    QVERIFY(!context->open().hasErrors());
    const auto event = context->history().createEvent(QStringLiteral("Shared"), at(9), at(10), QStringLiteral("shared"));
    QVERIFY(event);
    const QString path = context->persistence().pathForGroup(QStringLiteral("shared"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    const QByteArray partial = "BEGIN:VCALENDAR\r\nBEGIN:VEVENT\r\n";
    file.write(partial);
    file.close();
    QVERIFY(context->refresh().hasErrors());

    data::EventPatch patch;
    patch.title = QStringLiteral("Edited meanwhile");
    const auto error = context->history().updateEvent(event->id, patch);
    QVERIFY(error);
    QCOMPARE(error->code, core::ErrorCode::PersistenceWriteFailed);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), partial);
    file.close();

    // Refresh is not blocked forever by the queued edit; the cached state comes back.
    const auto report = context->refresh();
    QVERIFY(report.hasErrors());
    QCOMPARE(context->history().findById(event->id)->title, QStringLiteral("Shared"));
    QVERIFY(context->history().pendingGroups().isEmpty());
}

void AppContextTest::reopenSeesPersistedEvents()
{
    QUuid id;
    {
        auto context = makeContext();
        QVERIFY(!context->open().hasErrors());
        const auto event = context->history().createEvent(QStringLiteral("Persisted"), at(16), at(17), QString());
        QVERIFY(event);
        id = event->id;
    }

    auto context = makeContext();
    const auto report = context->open();
    QVERIFY(!report.hasErrors());
    QCOMPARE(report.events.size(), static_cast<std::size_t>(1));
    QCOMPARE(context->history().findById(id)->title, QStringLiteral("Persisted"));
    QVERIFY(!context->history().canUndo());

    QVERIFY(!context->history().deleteEvent(id));
    QVERIFY(context->refresh().events.empty());
}

void AppContextTest::hookRunsAfterWrites()
{
    auto settings = makeSettings();
    settings.postUpdateCommand = { QStringLiteral("true") };
    settings.postUpdateDelayMs = 20;
    core::AppContext context(settings, std::make_unique<SilentNotifier>());
    QVERIFY(!context.open().hasErrors());

    QSignalSpy triggered(&context.updateHook(), &core::UpdateHook::triggered);
    QVERIFY(context.history().createEvent(QStringLiteral("One"), at(9), at(10), QString()));
    QVERIFY(context.history().createEvent(QStringLiteral("Two"), at(10), at(11), QString()));
    QVERIFY(context.updateHook().isPending());
    QTRY_COMPARE(triggered.count(), 1);
}

void AppContextTest::schedulerReceivesSnapshots()
{
    auto context = makeContext();
    QVERIFY(!context->open().hasErrors());
    const QDateTime future = QDateTime::currentDateTimeUtc().addSecs(3600);
    const auto event = context->history().createEvent(QStringLiteral("Later"), future, future.addSecs(600), QString());
    QVERIFY(event);
    QVERIFY(context->scheduler().isArmed(event->id));
    QCOMPARE(context->scheduler().nextWake()->toSecsSinceEpoch(), future.toSecsSinceEpoch());

    QVERIFY(!context->undo());
    QVERIFY(!context->scheduler().nextWake());
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
