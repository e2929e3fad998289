#include "dayplan/ui/viewmodels/ScheduleViewModel.hpp"

#include "dayplan/data/EventRepository.hpp"

namespace dayplan {
namespace ui {

ScheduleViewModel::ScheduleViewModel(const data::EventRepository &repository, const QTimeZone &zone, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_zone(zone.isValid() ? zone : QTimeZone::systemTimeZone())
{
}

void ScheduleViewModel::setRange(const QDate &start, const QDate &end)
{
    if (!start.isValid() || !end.isValid() || end < start) {
        return;
    }
    m_start = start;
    m_end = end;
}

QDate ScheduleViewModel::rangeStart() const
{
    return m_start;
}

QDate ScheduleViewModel::rangeEnd() const
{
    return m_end;
}

void ScheduleViewModel::refresh()
{
    if (!m_start.isValid() || !m_end.isValid()) {
        return;
    }
    m_events = core::ColumnLayout::layoutDays(m_repository, m_start, m_end, m_zone);
    emit eventsChanged(m_events);
}

const std::vector<core::PlacedEvent> &ScheduleViewModel::events() const
{
    return m_events;
}

std::vector<core::PlacedEvent> ScheduleViewModel::eventsOn(const QDate &day) const
{
    std::vector<core::PlacedEvent> result;
    for (const auto &placed : m_events) {
        if (placed.day == day) {
            result.push_back(placed);
        }
    }
    return result;
}

std::optional<core::ColumnAssignment> ScheduleViewModel::columnFor(const QUuid &id, const QDate &day) const
{
    for (const auto &placed : m_events) {
        if (placed.day == day && placed.event.id == id) {
            return placed.column;
        }
    }
    return std::nullopt;
}

} // namespace ui
} // namespace dayplan
