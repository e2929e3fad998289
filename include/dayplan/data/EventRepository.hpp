#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Events whose [begin, end) range overlaps [from, to), ordered by begin.
    virtual std::vector<CalendarEvent> fetchEvents(const QDateTime &from, const QDateTime &to) const = 0;
    virtual std::optional<CalendarEvent> findById(const QUuid &id) const = 0;
    virtual std::size_t count() const = 0;
};

} // namespace data
} // namespace dayplan
