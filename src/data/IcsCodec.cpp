#include "dayplan/data/IcsCodec.hpp"

#include "dayplan/core/Logging.hpp"

#include <QDate>
#include <QHash>
#include <QRegularExpression>
#include <QTime>
#include <QTimeZone>
#include <algorithm>

namespace dayplan {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UTC_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto PRODUCT_ID = "-//Dayplan//Dayplan 1.0//EN";
constexpr auto COMPLETED_PROPERTY = "X-DAYPLAN-COMPLETED";
constexpr int MaxLineOctets = 75;

// Namespace for UUIDs derived from foreign UID values.
const QUuid ForeignUidNamespace(QStringLiteral("{5b1c0a0e-3f4e-4d7a-9a43-5f5d8f0c2a61}"));

struct ContentLine
{
    QString name;
    QString parameters;
    QString value;
};

ContentLine splitContentLine(const QString &line)
{
    ContentLine content;
    bool quoted = false;
    int colon = -1;
    for (int i = 0; i < line.size(); ++i) {
        const QChar c = line.at(i);
        if (c == QLatin1Char('"')) {
            quoted = !quoted;
        } else if (c == QLatin1Char(':') && !quoted) {
            colon = i;
            break;
        }
    }
    if (colon <= 0) {
        content.name = line.trimmed().toUpper();
        return content;
    }
    const QString property = line.left(colon);
    content.value = line.mid(colon + 1);
    const int semicolon = property.indexOf(QLatin1Char(';'));
    if (semicolon < 0) {
        content.name = property.toUpper();
    } else {
        content.name = property.left(semicolon).toUpper();
        content.parameters = property.mid(semicolon + 1);
    }
    return content;
}

QString parameterValue(const QString &parameters, const QString &key)
{
    const QStringList parts = parameters.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            continue;
        }
        if (part.left(equals).compare(key, Qt::CaseInsensitive) != 0) {
            continue;
        }
        QString value = part.mid(equals + 1);
        if (value.size() >= 2 && value.startsWith(QLatin1Char('"')) && value.endsWith(QLatin1Char('"'))) {
            value = value.mid(1, value.size() - 2);
        }
        return value;
    }
    return {};
}

QUuid uuidForUid(const QString &uid, QString *externalUid)
{
    QUuid id(uid.trimmed());
    if (!id.isNull()) {
        return id;
    }
    *externalUid = uid;
    return QUuid::createUuidV5(ForeignUidNamespace, uid);
}

struct EventBuilder
{
    CalendarEvent event;
    bool hasUid = false;
    bool hasEnd = false;
    bool dateOnlyStart = false;
    std::optional<qint64> durationSeconds;
    QDateTime stamp;

    std::optional<CalendarEvent> finish(const QString &group, int ordinal, QString *problem)
    {
        if (!event.begin.isValid()) {
            *problem = QStringLiteral("VEVENT #%1 has no valid DTSTART").arg(ordinal);
            return std::nullopt;
        }
        if (!hasEnd || !event.end.isValid()) {
            if (durationSeconds) {
                event.end = event.begin.addSecs(*durationSeconds);
            } else if (dateOnlyStart) {
                event.end = event.begin.addDays(1);
            } else {
                event.end = event.begin;
            }
        }
        if (event.end < event.begin) {
            qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Event" << event.title << "ends before it begins, treated as reminder";
            event.end = event.begin;
        }
        if (!hasUid) {
            // Stable across re-parses of the same file.
            const QString seed = QStringLiteral("%1|%2|%3")
                                     .arg(group, event.begin.toString(Qt::ISODate), event.title);
            event.id = QUuid::createUuidV5(ForeignUidNamespace, seed);
        }
        if (!event.created.isValid() && stamp.isValid()) {
            event.created = stamp;
        }
        if (!event.lastModified.isValid()) {
            event.lastModified = event.created;
        }
        event.begin = event.begin.toUTC();
        event.end = event.end.toUTC();
        // The group names the file it came from; rewriting it would send saves elsewhere.
        event.group = group.isEmpty() ? QString::fromLatin1(DefaultGroup) : group;
        return event;
    }
};

} // namespace

std::optional<CalendarDocument> IcsCodec::parse(const QString &text, const QString &group, core::Error *error)
{
    enum class Section {
        None,
        Calendar,
        Event,
        Done
    };

    auto fail = [&](const QString &problem) -> std::optional<CalendarDocument> {
        if (error) {
            *error = core::Error::parseFailed(QString(), problem);
        }
        return std::nullopt;
    };

    CalendarDocument document;
    Section section = Section::None;
    int calendarNesting = 0;
    int eventNesting = 0;
    int ordinal = 0;
    EventBuilder builder;

    const QStringList lines = unfoldLines(text);
    for (const QString &line : lines) {
        if (section == Section::Done) {
            break;
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const ContentLine content = splitContentLine(line);
        const QString component = content.value.trimmed().toUpper();

        if (section == Section::None) {
            if (content.name == QLatin1String("BEGIN") && component == QLatin1String("VCALENDAR")) {
                section = Section::Calendar;
                continue;
            }
            return fail(QStringLiteral("expected BEGIN:VCALENDAR, found \"%1\"").arg(line.left(40)));
        }

        if (section == Section::Calendar) {
            if (calendarNesting > 0) {
                document.extraLines << line;
                if (content.name == QLatin1String("BEGIN")) {
                    ++calendarNesting;
                } else if (content.name == QLatin1String("END")) {
                    --calendarNesting;
                }
                continue;
            }
            if (content.name == QLatin1String("BEGIN")) {
                if (component == QLatin1String("VEVENT")) {
                    section = Section::Event;
                    builder = EventBuilder{};
                    ++ordinal;
                } else {
                    document.extraLines << line;
                    calendarNesting = 1;
                }
            } else if (content.name == QLatin1String("END")) {
                if (component != QLatin1String("VCALENDAR")) {
                    return fail(QStringLiteral("unexpected END:%1").arg(component));
                }
                section = Section::Done;
            } else if (content.name != QLatin1String("VERSION") && content.name != QLatin1String("PRODID")) {
                document.extraLines << line;
            }
            continue;
        }

        // Section::Event
        if (eventNesting > 0) {
            builder.event.extraProperties << line;
            if (content.name == QLatin1String("BEGIN")) {
                ++eventNesting;
            } else if (content.name == QLatin1String("END")) {
                --eventNesting;
            }
            continue;
        }
        if (content.name == QLatin1String("BEGIN")) {
            builder.event.extraProperties << line;
            eventNesting = 1;
            continue;
        }
        if (content.name == QLatin1String("END")) {
            if (component != QLatin1String("VEVENT")) {
                return fail(QStringLiteral("unexpected END:%1 inside VEVENT").arg(component));
            }
            QString problem;
            auto event = builder.finish(group, ordinal, &problem);
            if (!event) {
                return fail(problem);
            }
            document.events.push_back(std::move(*event));
            section = Section::Calendar;
            continue;
        }

        const bool dateOnly = parameterValue(content.parameters, QStringLiteral("VALUE")).compare(QLatin1String("DATE"), Qt::CaseInsensitive) == 0
            || content.value.trimmed().size() == 8;
        if (content.name == QLatin1String("UID")) {
            builder.hasUid = true;
            builder.event.id = uuidForUid(content.value, &builder.event.externalUid);
        } else if (content.name == QLatin1String("SUMMARY")) {
            builder.event.title = decodeText(content.value);
        } else if (content.name == QLatin1String("DESCRIPTION")) {
            builder.event.notes = decodeText(content.value);
        } else if (content.name == QLatin1String("DTSTART")) {
            builder.event.begin = parseDateTime(content.value, content.parameters);
            builder.dateOnlyStart = dateOnly;
            if (!builder.event.begin.isValid()) {
                return fail(QStringLiteral("invalid DTSTART \"%1\"").arg(content.value));
            }
        } else if (content.name == QLatin1String("DTEND")) {
            builder.event.end = parseDateTime(content.value, content.parameters);
            builder.hasEnd = true;
        } else if (content.name == QLatin1String("DURATION")) {
            builder.durationSeconds = parseDurationSeconds(content.value);
        } else if (content.name == QLatin1String("DTSTAMP")) {
            builder.stamp = parseDateTime(content.value, content.parameters);
        } else if (content.name == QLatin1String("CREATED")) {
            builder.event.created = parseDateTime(content.value, content.parameters).toUTC();
        } else if (content.name == QLatin1String("LAST-MODIFIED")) {
            builder.event.lastModified = parseDateTime(content.value, content.parameters).toUTC();
        } else if (content.name == QLatin1String(COMPLETED_PROPERTY)) {
            builder.event.completed = content.value.trimmed().compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
        } else {
            builder.event.extraProperties << line;
        }
    }

    if (section != Section::Done) {
        return fail(QStringLiteral("calendar is not terminated by END:VCALENDAR"));
    }
    return document;
}

QString IcsCodec::serialize(const CalendarDocument &document)
{
    QStringList lines;
    lines << QStringLiteral("BEGIN:VCALENDAR");
    lines << QStringLiteral("VERSION:2.0");
    lines << QStringLiteral("PRODID:%1").arg(QLatin1String(PRODUCT_ID));
    lines << document.extraLines;

    auto events = document.events;
    std::sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        if (lhs.begin == rhs.begin) {
            return lhs.id < rhs.id;
        }
        return lhs.begin < rhs.begin;
    });

    const QString stamp = formatDateTime(nowUtc());
    for (const CalendarEvent &event : events) {
        lines << QStringLiteral("BEGIN:VEVENT");
        lines << QStringLiteral("UID:%1").arg(event.externalUid.isEmpty() ? event.id.toString(QUuid::WithoutBraces)
                                                                          : event.externalUid);
        lines << QStringLiteral("DTSTAMP:%1").arg(stamp);
        if (event.created.isValid()) {
            lines << QStringLiteral("CREATED:%1").arg(formatDateTime(event.created));
        }
        if (event.lastModified.isValid()) {
            lines << QStringLiteral("LAST-MODIFIED:%1").arg(formatDateTime(event.lastModified));
        }
        lines << QStringLiteral("SUMMARY:%1").arg(encodeText(event.title));
        if (!event.notes.isEmpty()) {
            lines << QStringLiteral("DESCRIPTION:%1").arg(encodeText(event.notes));
        }
        lines << QStringLiteral("DTSTART:%1").arg(formatDateTime(event.begin));
        lines << QStringLiteral("DTEND:%1").arg(formatDateTime(event.end));
        if (event.completed) {
            lines << QStringLiteral("%1:TRUE").arg(QLatin1String(COMPLETED_PROPERTY));
        }
        lines << event.extraProperties;
        lines << QStringLiteral("END:VEVENT");
    }
    lines << QStringLiteral("END:VCALENDAR");

    QString text;
    for (const QString &line : qAsConst(lines)) {
        text += foldLine(line);
        text += QLatin1String("\r\n");
    }
    return text;
}

QStringList IcsCodec::unfoldLines(const QString &text)
{
    QStringList lines;
    const QStringList raw = text.split(QLatin1Char('\n'));
    for (QString line : raw) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (!line.isEmpty() && (line.startsWith(QLatin1Char(' ')) || line.startsWith(QLatin1Char('\t')))) {
            if (!lines.isEmpty()) {
                lines.last() += line.mid(1);
            }
            continue;
        }
        lines << line;
    }
    return lines;
}

QString IcsCodec::foldLine(const QString &line)
{
    if (line.toUtf8().size() <= MaxLineOctets) {
        return line;
    }
    QString folded;
    int octets = 0;
    for (int i = 0; i < line.size();) {
        const int length = (line.at(i).isHighSurrogate() && i + 1 < line.size()) ? 2 : 1;
        const QString chunk = line.mid(i, length);
        const int width = chunk.toUtf8().size();
        if (octets + width > MaxLineOctets) {
            folded += QLatin1String("\r\n ");
            octets = 1;
        }
        folded += chunk;
        octets += width;
        i += length;
    }
    return folded;
}

QString IcsCodec::encodeText(const QString &text)
{
    QString encoded;
    encoded.reserve(text.size());
    for (const QChar c : text) {
        switch (c.unicode()) {
        case '\\':
            encoded += QLatin1String("\\\\");
            break;
        case '\n':
            encoded += QLatin1String("\\n");
            break;
        case '\r':
            break;
        case ',':
            encoded += QLatin1String("\\,");
            break;
        case ';':
            encoded += QLatin1String("\\;");
            break;
        default:
            encoded += c;
        }
    }
    return encoded;
}

QString IcsCodec::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded += c;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded += QLatin1Char('\n');
        } else if (next == QLatin1Char('\\') || next == QLatin1Char(',') || next == QLatin1Char(';')) {
            decoded += next;
        } else {
            decoded += c;
            decoded += next;
        }
    }
    return decoded;
}

QString IcsCodec::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(UTC_DATE_TIME_FORMAT));
}

QDateTime IcsCodec::parseDateTime(const QString &value, const QString &parameters)
{
    const QString trimmed = value.trimmed();
    if (trimmed.size() == 8) {
        const QDate date = QDate::fromString(trimmed, QLatin1String(DATE_FORMAT));
        return date.isValid() ? date.startOfDay() : QDateTime();
    }
    if (trimmed.endsWith(QLatin1Char('Z'), Qt::CaseInsensitive)) {
        QDateTime dt = QDateTime::fromString(trimmed.left(trimmed.size() - 1), QLatin1String(DATE_TIME_FORMAT));
        if (!dt.isValid()) {
            return {};
        }
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    const QDateTime local = QDateTime::fromString(trimmed, QLatin1String(DATE_TIME_FORMAT));
    if (!local.isValid()) {
        return QDateTime::fromString(trimmed, Qt::ISODate);
    }
    const QString tzid = parameterValue(parameters, QStringLiteral("TZID"));
    if (!tzid.isEmpty()) {
        const QTimeZone zone(tzid.toUtf8());
        if (zone.isValid()) {
            return QDateTime(local.date(), local.time(), zone);
        }
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Unknown TZID" << tzid << "treated as local time";
    }
    return local;
}

std::optional<qint64> IcsCodec::parseDurationSeconds(const QString &value)
{
    static const QRegularExpression pattern(QStringLiteral(
        "^([+-])?P(?:(\\d+)W)?(?:(\\d+)D)?(?:T(?:(\\d+)H)?(?:(\\d+)M)?(?:(\\d+)S)?)?$"));
    const QRegularExpressionMatch match = pattern.match(value.trimmed().toUpper());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const qint64 seconds = match.captured(2).toLongLong() * 7 * 24 * 3600
        + match.captured(3).toLongLong() * 24 * 3600
        + match.captured(4).toLongLong() * 3600
        + match.captured(5).toLongLong() * 60
        + match.captured(6).toLongLong();
    return match.captured(1) == QLatin1String("-") ? -seconds : seconds;
}

} // namespace data
} // namespace dayplan
