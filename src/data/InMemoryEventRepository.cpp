#include "dayplan/data/InMemoryEventRepository.hpp"

#include <algorithm>

namespace dayplan {
namespace data {

namespace {

bool beginsBefore(const CalendarEvent &lhs, const CalendarEvent &rhs)
{
    if (lhs.begin == rhs.begin) {
        if (lhs.end == rhs.end) {
            return lhs.id < rhs.id;
        }
        return lhs.end < rhs.end;
    }
    return lhs.begin < rhs.begin;
}

} // namespace

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<CalendarEvent> InMemoryEventRepository::fetchEvents(const QDateTime &from, const QDateTime &to) const
{
    const qint64 rangeBegin = from.toMSecsSinceEpoch();
    const qint64 rangeEnd = std::max(to.toMSecsSinceEpoch(), rangeBegin + 1);
    std::vector<CalendarEvent> events;
    for (const auto &event : m_events) {
        // Reminders cover the single instant they sit on.
        const qint64 end = std::max(event.endMs(), event.beginMs() + 1);
        if (event.beginMs() < rangeEnd && rangeBegin < end) {
            events.push_back(event);
        }
    }
    std::sort(events.begin(), events.end(), beginsBefore);
    return events;
}

std::optional<CalendarEvent> InMemoryEventRepository::findById(const QUuid &id) const
{
    const auto it = m_events.constFind(id);
    if (it == m_events.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::size_t InMemoryEventRepository::count() const
{
    return static_cast<std::size_t>(m_events.size());
}

std::optional<core::Error> InMemoryEventRepository::remove(const QUuid &id)
{
    if (m_events.remove(id) == 0) {
        return core::Error::notFound(QStringLiteral("No event with id %1").arg(id.toString(QUuid::WithoutBraces)));
    }
    return std::nullopt;
}

void InMemoryEventRepository::put(const CalendarEvent &event)
{
    m_events.insert(event.id, event);
}

bool InMemoryEventRepository::contains(const QUuid &id) const
{
    return m_events.contains(id);
}

std::vector<CalendarEvent> InMemoryEventRepository::all() const
{
    std::vector<CalendarEvent> events(m_events.cbegin(), m_events.cend());
    std::sort(events.begin(), events.end(), beginsBefore);
    return events;
}

void InMemoryEventRepository::clear()
{
    m_events.clear();
}

} // namespace data
} // namespace dayplan
