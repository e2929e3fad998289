#pragma once

#include <QDate>
#include <QDateTime>
#include <QHash>
#include <QTimeZone>
#include <QUuid>
#include <vector>

#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace data {
class EventRepository;
}

namespace core {

struct ColumnAssignment
{
    int column = 0;
    int columnCount = 1;

    bool operator==(const ColumnAssignment &other) const
    {
        return column == other.column && columnCount == other.columnCount;
    }
};

struct LayoutItem
{
    QUuid id;
    qint64 begin = 0;
    qint64 end = 0;
};

// One event clipped to one display day, ready for side-by-side rendering.
struct PlacedEvent
{
    data::CalendarEvent event;
    QDate day;
    QDateTime segmentBegin;
    QDateTime segmentEnd;
    ColumnAssignment column;
};

class ColumnLayout
{
public:
    // Greedy column packing per cluster of mutually overlapping items.
    static QHash<QUuid, ColumnAssignment> compute(std::vector<LayoutItem> items);

    // Lays out every event touching the display days [firstDay, lastDay] of zone.
    static std::vector<PlacedEvent> layoutDays(const data::EventRepository &repository,
                                               const QDate &firstDay,
                                               const QDate &lastDay,
                                               const QTimeZone &zone);
};

} // namespace core
} // namespace dayplan
