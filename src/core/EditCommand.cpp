#include "dayplan/core/EditCommand.hpp"

namespace dayplan {
namespace core {

QString editKindName(EditKind kind)
{
    switch (kind) {
    case EditKind::Create:
        return QStringLiteral("create");
    case EditKind::Delete:
        return QStringLiteral("delete");
    case EditKind::Move:
        return QStringLiteral("move");
    case EditKind::Resize:
        return QStringLiteral("resize");
    case EditKind::Retitle:
        return QStringLiteral("retitle");
    case EditKind::MarkComplete:
        return QStringLiteral("mark-complete");
    case EditKind::Update:
        return QStringLiteral("update");
    }
    return QStringLiteral("unknown");
}

EditCommand::EditCommand(EditKind kind,
                         std::optional<data::CalendarEvent> before,
                         std::optional<data::CalendarEvent> after)
    : m_kind(kind)
    , m_eventId(after ? after->id : (before ? before->id : QUuid()))
    , m_before(std::move(before))
    , m_after(std::move(after))
{
}

EditCommand EditCommand::create(data::CalendarEvent event)
{
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    event.begin = data::wholeSeconds(event.begin);
    event.end = data::wholeSeconds(event.end);
    event.group = data::normalizeGroup(event.group);
    if (!event.created.isValid()) {
        event.created = data::nowUtc();
    }
    if (!event.lastModified.isValid()) {
        event.lastModified = event.created;
    }
    return EditCommand(EditKind::Create, std::nullopt, std::move(event));
}

EditCommand EditCommand::remove(const data::CalendarEvent &existing)
{
    return EditCommand(EditKind::Delete, existing, std::nullopt);
}

EditCommand EditCommand::move(const data::CalendarEvent &existing, const QDateTime &begin, const QDateTime &end)
{
    data::EventPatch patch;
    patch.begin = begin;
    patch.end = end;
    return EditCommand(EditKind::Move, existing, data::applyPatch(existing, patch));
}

EditCommand EditCommand::resize(const data::CalendarEvent &existing, const QDateTime &begin, const QDateTime &end)
{
    data::EventPatch patch;
    patch.begin = begin;
    patch.end = end;
    return EditCommand(EditKind::Resize, existing, data::applyPatch(existing, patch));
}

EditCommand EditCommand::retitle(const data::CalendarEvent &existing, const QString &title)
{
    data::EventPatch patch;
    patch.title = title;
    return EditCommand(EditKind::Retitle, existing, data::applyPatch(existing, patch));
}

EditCommand EditCommand::markComplete(const data::CalendarEvent &existing, bool completed)
{
    data::EventPatch patch;
    patch.completed = completed;
    return EditCommand(EditKind::MarkComplete, existing, data::applyPatch(existing, patch));
}

EditCommand EditCommand::update(const data::CalendarEvent &existing, const data::EventPatch &patch)
{
    return EditCommand(EditKind::Update, existing, data::applyPatch(existing, patch));
}

EditKind EditCommand::kind() const
{
    return m_kind;
}

QUuid EditCommand::eventId() const
{
    return m_eventId;
}

const std::optional<data::CalendarEvent> &EditCommand::before() const
{
    return m_before;
}

const std::optional<data::CalendarEvent> &EditCommand::after() const
{
    return m_after;
}

EditCommand EditCommand::inverted() const
{
    return EditCommand(m_kind, m_after, m_before);
}

QString EditCommand::description() const
{
    const auto &subject = m_after ? m_after : m_before;
    return QStringLiteral("%1 \"%2\"").arg(editKindName(m_kind), subject ? subject->title : QString());
}

} // namespace core
} // namespace dayplan
