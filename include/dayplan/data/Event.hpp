#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <optional>

namespace dayplan {
namespace data {

// Group used when an event is created without one.
constexpr auto DefaultGroup = "personal";

struct CalendarEvent
{
    QUuid id = QUuid::createUuid();
    // Original UID text for events imported from files whose UID is not a UUID.
    QString externalUid;
    QString title;
    QString notes;
    // Always stored in UTC.
    QDateTime begin;
    QDateTime end;
    QString group = QString::fromLatin1(DefaultGroup);
    bool completed = false;
    QDateTime created;
    QDateTime lastModified;
    // Unfolded content lines of properties and sub-components this library does
    // not interpret, kept verbatim for re-emission.
    QStringList extraProperties;

    qint64 beginMs() const;
    qint64 endMs() const;
    qint64 durationMs() const;
    bool isReminder() const;

    bool operator==(const CalendarEvent &other) const;
    bool operator!=(const CalendarEvent &other) const { return !(*this == other); }
};

struct EventPatch
{
    std::optional<QString> title;
    std::optional<QString> notes;
    std::optional<QDateTime> begin;
    std::optional<QDateTime> end;
    std::optional<QString> group;
    std::optional<bool> completed;

    bool isEmpty() const;
};

// Current time truncated to whole seconds, the resolution of the file format.
QDateTime nowUtc();
// UTC copy of time with the milliseconds dropped.
QDateTime wholeSeconds(const QDateTime &time);

bool isValidRange(const QDateTime &begin, const QDateTime &end);

// Maps a user-typed group name to a safe calendar file base name. Names read
// back from existing files are used as they are.
QString normalizeGroup(const QString &group);

// Returns a copy of event with the patch applied and lastModified refreshed.
CalendarEvent applyPatch(const CalendarEvent &event, const EventPatch &patch);

} // namespace data
} // namespace dayplan
