#include <QtTest/QtTest>

#include "dayplan/core/EditHistory.hpp"
#include "dayplan/data/InMemoryEventRepository.hpp"

using namespace dayplan;

namespace {

QDateTime at(int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 3, 4), QTime(hour, minute), Qt::UTC);
}

data::CalendarEvent makeEvent(const QString &title, const QDateTime &begin, const QDateTime &end)
{
    data::CalendarEvent event;
    event.title = title;
    event.begin = begin;
    event.end = end;
    return event;
}

} // namespace

class EventModelTest : public QObject
{
    Q_OBJECT

private slots:
    void createNormalizes();
    void createRejectsInvertedRange();
    void updateAppliesPatch();
    void updateErrors();
    void removeMissing();
    void fetchIncludesReminders();
    void dropsSubSecondPrecision();
    void normalizeGroupNames();
};

void EventModelTest::createNormalizes()
{
    core::EditHistory model;
    const QDateTime localBegin(QDate(2024, 3, 4), QTime(9, 0), Qt::OffsetFromUTC, 3600);
    const auto event = model.createEvent(QStringLiteral("Standup"), localBegin, localBegin.addSecs(900), QString());
    QVERIFY(event);
    QCOMPARE(event->begin.timeSpec(), Qt::UTC);
    QCOMPARE(event->begin, at(8));
    QCOMPARE(event->group, QStringLiteral("personal"));
    QVERIFY(event->created.isValid());
    QCOMPARE(event->lastModified, event->created);
    QCOMPARE(*model.findById(event->id), *event);
    QCOMPARE(model.count(), static_cast<std::size_t>(1));
}

void EventModelTest::createRejectsInvertedRange()
{
    core::EditHistory model;
    core::Error error;
    QVERIFY(!model.createEvent(QStringLiteral("Broken"), at(10), at(9), QString(), &error));
    QCOMPARE(error.code, core::ErrorCode::InvalidRange);
    QVERIFY(!model.createEvent(QStringLiteral("Broken"), QDateTime(), at(9), QString(), &error));
    QCOMPARE(model.count(), static_cast<std::size_t>(0));

    // Zero duration is a reminder, not an error.
    const auto reminder = model.createEvent(QStringLiteral("Pills"), at(9), at(9), QString());
    QVERIFY(reminder);
    QVERIFY(reminder->isReminder());
}

void EventModelTest::updateAppliesPatch()
{
    core::EditHistory model;
    const auto event = model.createEvent(QStringLiteral("Draft"), at(9), at(10), QStringLiteral("work"));
    QVERIFY(event);

    data::EventPatch patch;
    QVERIFY(patch.isEmpty());
    patch.title = QStringLiteral("Final");
    patch.notes = QStringLiteral("Bring slides");
    patch.completed = true;
    QVERIFY(!model.updateEvent(event->id, patch));
    const auto updated = model.findById(event->id);
    QVERIFY(updated);
    QCOMPARE(updated->title, QStringLiteral("Final"));
    QCOMPARE(updated->notes, QStringLiteral("Bring slides"));
    QVERIFY(updated->completed);
    QCOMPARE(updated->begin, event->begin);
    QVERIFY(updated->lastModified >= event->lastModified);
}

void EventModelTest::updateErrors()
{
    core::EditHistory model;
    const auto event = model.createEvent(QStringLiteral("Fixed"), at(9), at(10), QString());
    QVERIFY(event);

    data::EventPatch patch;
    patch.begin = at(11);
    auto error = model.updateEvent(event->id, patch);
    QVERIFY(error);
    QCOMPARE(error->code, core::ErrorCode::InvalidRange);
    QCOMPARE(*model.findById(event->id), *event);

    error = model.updateEvent(QUuid::createUuid(), patch);
    QVERIFY(error);
    QCOMPARE(error->code, core::ErrorCode::NotFound);
}

void EventModelTest::removeMissing()
{
    data::InMemoryEventRepository repo;
    const auto event = makeEvent(QStringLiteral("Gone"), at(9), at(10));
    repo.put(event);
    QVERIFY(repo.contains(event.id));
    QVERIFY(!repo.remove(event.id));
    const auto error = repo.remove(event.id);
    QVERIFY(error);
    QCOMPARE(error->code, core::ErrorCode::NotFound);

    core::EditHistory model;
    const auto deleteError = model.deleteEvent(event.id);
    QVERIFY(deleteError);
    QCOMPARE(deleteError->code, core::ErrorCode::NotFound);
}

void EventModelTest::fetchIncludesReminders()
{
    data::InMemoryEventRepository repo;
    repo.put(makeEvent(QStringLiteral("Block"), at(9), at(10)));
    repo.put(makeEvent(QStringLiteral("Ping"), at(10), at(10)));

    QCOMPARE(repo.fetchEvents(at(9), at(10)).size(), static_cast<std::size_t>(1));
    const auto later = repo.fetchEvents(at(10), at(11));
    QCOMPARE(later.size(), static_cast<std::size_t>(1));
    QCOMPARE(later.front().title, QStringLiteral("Ping"));
    QCOMPARE(repo.all().front().title, QStringLiteral("Block"));
}

void EventModelTest::dropsSubSecondPrecision()
{
    QCOMPARE(data::wholeSeconds(at(10).addMSecs(500)), at(10));
    QCOMPARE(data::wholeSeconds(at(10)), at(10));
    const QDateTime beforeEpoch = QDateTime::fromMSecsSinceEpoch(-1500, Qt::UTC);
    QCOMPARE(data::wholeSeconds(beforeEpoch).toMSecsSinceEpoch(), qint64(-2000));
    QVERIFY(!data::wholeSeconds(QDateTime()).isValid());

    core::EditHistory model;
    const auto event = model.createEvent(QStringLiteral("Precise"), at(10).addMSecs(500), at(11).addMSecs(999), QString());
    QVERIFY(event);
    QCOMPARE(event->begin, at(10));
    QCOMPARE(event->end, at(11));

    data::EventPatch patch;
    patch.end = at(12).addMSecs(250);
    QVERIFY(!model.updateEvent(event->id, patch));
    QCOMPARE(model.findById(event->id)->end, at(12));
}

void EventModelTest::normalizeGroupNames()
{
    QCOMPARE(data::normalizeGroup(QString()), QStringLiteral("personal"));
    QCOMPARE(data::normalizeGroup(QStringLiteral("  work ")), QStringLiteral("work"));
    QCOMPARE(data::normalizeGroup(QStringLiteral("../etc/passwd")), QStringLiteral("_etc_passwd"));
    QCOMPARE(data::normalizeGroup(QStringLiteral("me@example.com")), QStringLiteral("me@example.com"));
    QCOMPARE(data::normalizeGroup(QStringLiteral("Team (A)")), QStringLiteral("Team (A)"));
    QCOMPARE(data::normalizeGroup(QStringLiteral("a\\b")), QStringLiteral("a_b"));
}

QTEST_GUILESS_MAIN(EventModelTest)
#include "EventModelTest.moc"
