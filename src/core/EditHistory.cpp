#include "dayplan/core/EditHistory.hpp"

#include "dayplan/core/Logging.hpp"
#include "dayplan/core/PersistenceSink.hpp"

namespace dayplan {
namespace core {

EditHistory::EditHistory(std::size_t undoLimit, QObject *parent)
    : QObject(parent)
    , m_stack(undoLimit)
{
}

EditHistory::~EditHistory() = default;

void EditHistory::setPersistenceSink(PersistenceSink *sink)
{
    m_sink = sink;
}

std::optional<Error> EditHistory::commit(EditCommand command)
{
    if (auto error = validate(command)) {
        qCDebug(DAYPLAN_HISTORY_LOG) << "Rejected" << command.description() << error->toString();
        return error;
    }
    applyState(command.eventId(), command.after());
    qCDebug(DAYPLAN_HISTORY_LOG) << "Committed" << command.description();
    m_stack.push(command);
    emit eventsChanged({ command.eventId() });
    return persist(command);
}

std::optional<Error> EditHistory::undo()
{
    const auto command = m_stack.undo();
    if (!command) {
        return Error::nothingToUndo();
    }
    applyState(command->eventId(), command->before());
    qCDebug(DAYPLAN_HISTORY_LOG) << "Undid" << command->description();
    emit eventsChanged({ command->eventId() });
    return persist(*command);
}

std::optional<Error> EditHistory::redo()
{
    const auto command = m_stack.redo();
    if (!command) {
        return Error::nothingToRedo();
    }
    applyState(command->eventId(), command->after());
    qCDebug(DAYPLAN_HISTORY_LOG) << "Redid" << command->description();
    emit eventsChanged({ command->eventId() });
    return persist(*command);
}

bool EditHistory::canUndo() const
{
    return m_stack.canUndo();
}

bool EditHistory::canRedo() const
{
    return m_stack.canRedo();
}

std::size_t EditHistory::undoCount() const
{
    return m_stack.undoCount();
}

std::size_t EditHistory::redoCount() const
{
    return m_stack.redoCount();
}

void EditHistory::clearHistory()
{
    m_stack.clear();
}

std::optional<data::CalendarEvent> EditHistory::createEvent(const QString &title,
                                                            const QDateTime &begin,
                                                            const QDateTime &end,
                                                            const QString &group,
                                                            Error *error)
{
    data::CalendarEvent event;
    event.title = title;
    event.begin = begin;
    event.end = end;
    event.group = group;
    EditCommand command = EditCommand::create(std::move(event));
    const data::CalendarEvent created = *command.after();
    if (auto failure = commit(std::move(command))) {
        if (error) {
            *error = *failure;
        }
        if (!failure->isPersistenceFailure()) {
            return std::nullopt;
        }
    }
    return created;
}

std::optional<Error> EditHistory::deleteEvent(const QUuid &id)
{
    const auto existing = m_events.findById(id);
    if (!existing) {
        return Error::notFound(QStringLiteral("No event with id %1").arg(id.toString(QUuid::WithoutBraces)));
    }
    return commit(EditCommand::remove(*existing));
}

std::optional<Error> EditHistory::updateEvent(const QUuid &id, const data::EventPatch &patch)
{
    const auto existing = m_events.findById(id);
    if (!existing) {
        return Error::notFound(QStringLiteral("No event with id %1").arg(id.toString(QUuid::WithoutBraces)));
    }
    return commit(EditCommand::update(*existing, patch));
}

void EditHistory::reload(const std::vector<data::CalendarEvent> &events)
{
    m_events.clear();
    m_index.clear();
    m_pendingGroups.clear();
    for (const auto &event : events) {
        m_events.put(event);
        m_index.insert(event.id, event.beginMs(), event.endMs());
    }
    qCDebug(DAYPLAN_HISTORY_LOG) << "Reloaded" << events.size() << "events";
    emit eventsReloaded();
}

std::optional<Error> EditHistory::retryPendingWrites()
{
    if (m_pendingGroups.isEmpty()) {
        return std::nullopt;
    }
    return writeGroups(pendingGroups());
}

QStringList EditHistory::pendingGroups() const
{
    QStringList groups = m_pendingGroups.values();
    groups.sort();
    return groups;
}

std::vector<data::CalendarEvent> EditHistory::fetchEvents(const QDateTime &from, const QDateTime &to) const
{
    std::vector<data::CalendarEvent> result;
    const auto intervals = m_index.overlapping(from.toMSecsSinceEpoch(), to.toMSecsSinceEpoch());
    result.reserve(intervals.size());
    for (const auto &interval : intervals) {
        if (auto event = m_events.findById(interval.id)) {
            result.push_back(std::move(*event));
        }
    }
    return result;
}

std::optional<data::CalendarEvent> EditHistory::findById(const QUuid &id) const
{
    return m_events.findById(id);
}

std::size_t EditHistory::count() const
{
    return m_events.count();
}

std::vector<data::CalendarEvent> EditHistory::events() const
{
    return m_events.all();
}

std::vector<data::CalendarEvent> EditHistory::eventsInGroup(const QString &group) const
{
    std::vector<data::CalendarEvent> result;
    for (auto &event : m_events.all()) {
        if (event.group == group) {
            result.push_back(std::move(event));
        }
    }
    return result;
}

std::vector<data::CalendarEvent> EditHistory::conflictsWith(const QUuid &id) const
{
    std::vector<data::CalendarEvent> result;
    for (const auto &interval : m_index.conflicts(id)) {
        if (auto event = m_events.findById(interval.id)) {
            result.push_back(std::move(*event));
        }
    }
    return result;
}

const IntervalIndex &EditHistory::index() const
{
    return m_index;
}

std::optional<Error> EditHistory::validate(const EditCommand &command) const
{
    const QString idText = command.eventId().toString(QUuid::WithoutBraces);
    if (command.kind() == EditKind::Create && !command.after()) {
        return Error::invalidRange(QStringLiteral("Create command without an event"));
    }
    // Undo and redo replay states directly; only a fresh create can collide.
    if (command.kind() == EditKind::Create && m_events.contains(command.eventId())) {
        return Error::duplicateId(QStringLiteral("An event with id %1 already exists").arg(idText));
    }
    if (command.before() && !m_events.contains(command.eventId())) {
        return Error::notFound(QStringLiteral("No event with id %1").arg(idText));
    }
    if (command.after() && !data::isValidRange(command.after()->begin, command.after()->end)) {
        return Error::invalidRange(QStringLiteral("Event \"%1\" ends before it begins").arg(command.after()->title));
    }
    return std::nullopt;
}

void EditHistory::applyState(const QUuid &id, const std::optional<data::CalendarEvent> &state)
{
    if (state) {
        m_events.put(*state);
        m_index.insert(id, state->beginMs(), state->endMs());
        return;
    }
    // Already absent when a reload dropped the event in the meantime.
    if (const auto missing = m_events.remove(id)) {
        qCDebug(DAYPLAN_HISTORY_LOG) << missing->toString();
    }
    m_index.remove(id);
}

std::optional<Error> EditHistory::persist(const EditCommand &command)
{
    QStringList groups;
    if (command.before()) {
        groups << command.before()->group;
    }
    if (command.after() && !groups.contains(command.after()->group)) {
        groups << command.after()->group;
    }
    return writeGroups(groups);
}

std::optional<Error> EditHistory::writeGroups(const QStringList &groups)
{
    if (!m_sink) {
        return std::nullopt;
    }
    std::optional<Error> firstError;
    QStringList written;
    for (const QString &group : groups) {
        if (auto error = m_sink->writeGroup(group, eventsInGroup(group))) {
            qCWarning(DAYPLAN_HISTORY_LOG) << "Write of group" << group << "failed, queued for retry:" << error->toString();
            m_pendingGroups.insert(group);
            if (!firstError) {
                firstError = error;
            }
            continue;
        }
        m_pendingGroups.remove(group);
        written << group;
    }
    if (!written.isEmpty()) {
        emit groupsPersisted(written);
    }
    return firstError;
}

} // namespace core
} // namespace dayplan
