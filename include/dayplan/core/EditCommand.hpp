#pragma once

#include <QString>
#include <optional>

#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace core {

enum class EditKind
{
    Create,
    Delete,
    Move,
    Resize,
    Retitle,
    MarkComplete,
    Update,
};

QString editKindName(EditKind kind);

// One reversible mutation. Both the state before and after the edit are
// captured when the command is built, so undoing never consults the model.
class EditCommand
{
public:
    static EditCommand create(data::CalendarEvent event);
    static EditCommand remove(const data::CalendarEvent &existing);
    static EditCommand move(const data::CalendarEvent &existing, const QDateTime &begin, const QDateTime &end);
    static EditCommand resize(const data::CalendarEvent &existing, const QDateTime &begin, const QDateTime &end);
    static EditCommand retitle(const data::CalendarEvent &existing, const QString &title);
    static EditCommand markComplete(const data::CalendarEvent &existing, bool completed);
    static EditCommand update(const data::CalendarEvent &existing, const data::EventPatch &patch);

    EditKind kind() const;
    QUuid eventId() const;
    // Absent before a create and after a delete.
    const std::optional<data::CalendarEvent> &before() const;
    const std::optional<data::CalendarEvent> &after() const;

    EditCommand inverted() const;
    QString description() const;

private:
    EditCommand(EditKind kind,
                std::optional<data::CalendarEvent> before,
                std::optional<data::CalendarEvent> after);

    EditKind m_kind;
    QUuid m_eventId;
    std::optional<data::CalendarEvent> m_before;
    std::optional<data::CalendarEvent> m_after;
};

} // namespace core
} // namespace dayplan
