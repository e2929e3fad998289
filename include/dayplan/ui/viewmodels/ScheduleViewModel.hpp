#pragma once

#include <QDate>
#include <QObject>
#include <QTimeZone>
#include <optional>
#include <vector>

#include "dayplan/core/ColumnLayout.hpp"

namespace dayplan {
namespace data {
class EventRepository;
}

namespace ui {

// Day range of laid out events for a calendar view. Rendering code reads
// events() after eventsChanged.
class ScheduleViewModel : public QObject
{
    Q_OBJECT

public:
    ScheduleViewModel(const data::EventRepository &repository,
                      const QTimeZone &zone = QTimeZone::systemTimeZone(),
                      QObject *parent = nullptr);

    void setRange(const QDate &start, const QDate &end);
    QDate rangeStart() const;
    QDate rangeEnd() const;

    const std::vector<core::PlacedEvent> &events() const;
    std::vector<core::PlacedEvent> eventsOn(const QDate &day) const;
    std::optional<core::ColumnAssignment> columnFor(const QUuid &id, const QDate &day) const;

public slots:
    void refresh();

signals:
    void eventsChanged(const std::vector<dayplan::core::PlacedEvent> &events);

private:
    const data::EventRepository &m_repository;
    QTimeZone m_zone;
    QDate m_start;
    QDate m_end;
    std::vector<core::PlacedEvent> m_events;
};

} // namespace ui
} // namespace dayplan
