#pragma once

#include <QHash>

#include "dayplan/core/Error.hpp"
#include "dayplan/data/EventRepository.hpp"

namespace dayplan {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<CalendarEvent> fetchEvents(const QDateTime &from, const QDateTime &to) const override;
    std::optional<CalendarEvent> findById(const QUuid &id) const override;
    std::size_t count() const override;

    std::optional<core::Error> remove(const QUuid &id);
    // Inserts or overwrites the stored state of event.id verbatim.
    void put(const CalendarEvent &event);

    bool contains(const QUuid &id) const;
    std::vector<CalendarEvent> all() const;
    void clear();

private:
    QHash<QUuid, CalendarEvent> m_events;
};

} // namespace data
} // namespace dayplan
