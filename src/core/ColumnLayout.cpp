#include "dayplan/core/ColumnLayout.hpp"

#include "dayplan/data/EventRepository.hpp"

#include <algorithm>

namespace dayplan {
namespace core {

namespace {

qint64 effectiveEnd(const LayoutItem &item)
{
    return item.end > item.begin ? item.end : item.begin + 1;
}

void placeCluster(const std::vector<LayoutItem> &cluster, QHash<QUuid, ColumnAssignment> &result)
{
    std::vector<qint64> columnEnds;
    std::vector<int> columns;
    columns.reserve(cluster.size());
    for (const auto &item : cluster) {
        int column = -1;
        for (std::size_t i = 0; i < columnEnds.size(); ++i) {
            if (columnEnds[i] <= item.begin) {
                column = static_cast<int>(i);
                break;
            }
        }
        if (column < 0) {
            column = static_cast<int>(columnEnds.size());
            columnEnds.push_back(0);
        }
        columnEnds[static_cast<std::size_t>(column)] = effectiveEnd(item);
        columns.push_back(column);
    }
    const int columnCount = static_cast<int>(columnEnds.size());
    for (std::size_t i = 0; i < cluster.size(); ++i) {
        result.insert(cluster[i].id, ColumnAssignment{ columns[i], columnCount });
    }
}

} // namespace

QHash<QUuid, ColumnAssignment> ColumnLayout::compute(std::vector<LayoutItem> items)
{
    std::sort(items.begin(), items.end(), [](const LayoutItem &lhs, const LayoutItem &rhs) {
        if (lhs.begin != rhs.begin) {
            return lhs.begin < rhs.begin;
        }
        const qint64 lhsDuration = lhs.end - lhs.begin;
        const qint64 rhsDuration = rhs.end - rhs.begin;
        if (lhsDuration != rhsDuration) {
            return lhsDuration < rhsDuration;
        }
        return lhs.id < rhs.id;
    });

    QHash<QUuid, ColumnAssignment> result;
    std::vector<LayoutItem> cluster;
    qint64 clusterEnd = 0;
    for (const auto &item : items) {
        if (!cluster.empty() && item.begin >= clusterEnd) {
            placeCluster(cluster, result);
            cluster.clear();
        }
        if (cluster.empty()) {
            clusterEnd = effectiveEnd(item);
        } else {
            clusterEnd = std::max(clusterEnd, effectiveEnd(item));
        }
        cluster.push_back(item);
    }
    if (!cluster.empty()) {
        placeCluster(cluster, result);
    }
    return result;
}

std::vector<PlacedEvent> ColumnLayout::layoutDays(const data::EventRepository &repository,
                                                  const QDate &firstDay,
                                                  const QDate &lastDay,
                                                  const QTimeZone &zone)
{
    std::vector<PlacedEvent> placed;
    if (!firstDay.isValid() || !lastDay.isValid() || lastDay < firstDay) {
        return placed;
    }

    for (QDate day = firstDay; day <= lastDay; day = day.addDays(1)) {
        const QDateTime dayBegin = day.startOfDay(zone);
        const QDateTime dayEnd = day.addDays(1).startOfDay(zone);
        const auto events = repository.fetchEvents(dayBegin, dayEnd);

        std::vector<PlacedEvent> segments;
        std::vector<LayoutItem> items;
        segments.reserve(events.size());
        items.reserve(events.size());
        for (const auto &event : events) {
            PlacedEvent segment;
            segment.event = event;
            segment.day = day;
            segment.segmentBegin = std::max(event.begin, dayBegin).toTimeZone(zone);
            segment.segmentEnd = std::min(event.end, dayEnd).toTimeZone(zone);
            if (segment.segmentEnd < segment.segmentBegin) {
                segment.segmentEnd = segment.segmentBegin;
            }
            items.push_back(LayoutItem{ event.id,
                                        segment.segmentBegin.toMSecsSinceEpoch(),
                                        segment.segmentEnd.toMSecsSinceEpoch() });
            segments.push_back(std::move(segment));
        }

        const auto columns = compute(std::move(items));
        for (auto &segment : segments) {
            segment.column = columns.value(segment.event.id);
            placed.push_back(std::move(segment));
        }
    }
    return placed;
}

} // namespace core
} // namespace dayplan
