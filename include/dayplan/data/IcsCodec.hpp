#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "dayplan/core/Error.hpp"
#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace data {

struct CalendarDocument
{
    // Calendar level properties and components other than VERSION and PRODID,
    // unfolded and verbatim.
    QStringList extraLines;
    std::vector<CalendarEvent> events;
};

// Translation between iCalendar (RFC 5545) text and events. One calendar file
// holds the VEVENTs of one group.
class IcsCodec
{
public:
    static std::optional<CalendarDocument> parse(const QString &text, const QString &group, core::Error *error = nullptr);
    static QString serialize(const CalendarDocument &document);

    static QStringList unfoldLines(const QString &text);
    static QString foldLine(const QString &line);
    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value, const QString &parameters = QString());
    static std::optional<qint64> parseDurationSeconds(const QString &value);
};

} // namespace data
} // namespace dayplan
