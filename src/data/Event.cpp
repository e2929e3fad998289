#include "dayplan/data/Event.hpp"

#include <QRegularExpression>

namespace dayplan {
namespace data {

qint64 CalendarEvent::beginMs() const
{
    return begin.toMSecsSinceEpoch();
}

qint64 CalendarEvent::endMs() const
{
    return end.toMSecsSinceEpoch();
}

qint64 CalendarEvent::durationMs() const
{
    return endMs() - beginMs();
}

bool CalendarEvent::isReminder() const
{
    return begin == end;
}

bool CalendarEvent::operator==(const CalendarEvent &other) const
{
    return id == other.id
        && externalUid == other.externalUid
        && title == other.title
        && notes == other.notes
        && begin == other.begin
        && end == other.end
        && group == other.group
        && completed == other.completed
        && created == other.created
        && lastModified == other.lastModified
        && extraProperties == other.extraProperties;
}

bool EventPatch::isEmpty() const
{
    return !title && !notes && !begin && !end && !group && !completed;
}

QDateTime nowUtc()
{
    return wholeSeconds(QDateTime::currentDateTimeUtc());
}

QDateTime wholeSeconds(const QDateTime &time)
{
    if (!time.isValid()) {
        return time;
    }
    const QDateTime utc = time.toUTC();
    const qint64 remainder = utc.toMSecsSinceEpoch() % 1000;
    // Pre-epoch instants have a negative remainder.
    return utc.addMSecs(-(remainder < 0 ? remainder + 1000 : remainder));
}

bool isValidRange(const QDateTime &begin, const QDateTime &end)
{
    return begin.isValid() && end.isValid() && end >= begin;
}

QString normalizeGroup(const QString &group)
{
    static const QRegularExpression unsafe(QStringLiteral("[/\\\\\\x00-\\x1f\\x7f]"));
    QString normalized = group.trimmed();
    normalized.replace(unsafe, QStringLiteral("_"));
    while (normalized.startsWith(QLatin1Char('.'))) {
        normalized.remove(0, 1);
    }
    if (normalized.isEmpty()) {
        return QString::fromLatin1(DefaultGroup);
    }
    return normalized;
}

CalendarEvent applyPatch(const CalendarEvent &event, const EventPatch &patch)
{
    CalendarEvent patched = event;
    if (patch.title) {
        patched.title = *patch.title;
    }
    if (patch.notes) {
        patched.notes = *patch.notes;
    }
    if (patch.begin) {
        patched.begin = wholeSeconds(*patch.begin);
    }
    if (patch.end) {
        patched.end = wholeSeconds(*patch.end);
    }
    if (patch.group) {
        patched.group = normalizeGroup(*patch.group);
    }
    if (patch.completed) {
        patched.completed = *patch.completed;
    }
    patched.lastModified = nowUtc();
    return patched;
}

} // namespace data
} // namespace dayplan
