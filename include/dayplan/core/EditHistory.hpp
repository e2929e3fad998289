#pragma once

#include <QList>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <optional>

#include "dayplan/core/EditCommand.hpp"
#include "dayplan/core/Error.hpp"
#include "dayplan/core/IntervalIndex.hpp"
#include "dayplan/core/UndoStack.hpp"
#include "dayplan/data/EventRepository.hpp"
#include "dayplan/data/InMemoryEventRepository.hpp"

namespace dayplan {
namespace core {

class PersistenceSink;

// Owns the event set and its interval index. Every mutation goes through
// commit(), undo() or redo(), which keep model and index in step and then
// write the touched groups through the persistence sink.
class EditHistory : public QObject, public data::EventRepository
{
    Q_OBJECT

public:
    explicit EditHistory(std::size_t undoLimit = 100, QObject *parent = nullptr);
    ~EditHistory() override;

    void setPersistenceSink(PersistenceSink *sink);

    // Model errors leave everything untouched. A PersistenceWriteFailed error
    // means the edit is applied and undoable but not yet durable.
    std::optional<Error> commit(EditCommand command);
    std::optional<Error> undo();
    std::optional<Error> redo();

    bool canUndo() const;
    bool canRedo() const;
    std::size_t undoCount() const;
    std::size_t redoCount() const;
    void clearHistory();

    // Convenience wrappers building and committing the matching command.
    std::optional<data::CalendarEvent> createEvent(const QString &title,
                                                   const QDateTime &begin,
                                                   const QDateTime &end,
                                                   const QString &group,
                                                   Error *error = nullptr);
    std::optional<Error> deleteEvent(const QUuid &id);
    std::optional<Error> updateEvent(const QUuid &id, const data::EventPatch &patch);

    // Replaces the event set with freshly loaded data. Undo history is kept.
    void reload(const std::vector<data::CalendarEvent> &events);

    // Writes every group whose last write failed, using the current state.
    std::optional<Error> retryPendingWrites();
    QStringList pendingGroups() const;

    std::vector<data::CalendarEvent> fetchEvents(const QDateTime &from, const QDateTime &to) const override;
    std::optional<data::CalendarEvent> findById(const QUuid &id) const override;
    std::size_t count() const override;

    std::vector<data::CalendarEvent> events() const;
    std::vector<data::CalendarEvent> eventsInGroup(const QString &group) const;
    std::vector<data::CalendarEvent> conflictsWith(const QUuid &id) const;
    const IntervalIndex &index() const;

signals:
    void eventsChanged(const QList<QUuid> &ids);
    void eventsReloaded();
    void groupsPersisted(const QStringList &groups);

private:
    std::optional<Error> validate(const EditCommand &command) const;
    void applyState(const QUuid &id, const std::optional<data::CalendarEvent> &state);
    std::optional<Error> persist(const EditCommand &command);
    std::optional<Error> writeGroups(const QStringList &groups);

    data::InMemoryEventRepository m_events;
    IntervalIndex m_index;
    UndoStack m_stack;
    PersistenceSink *m_sink = nullptr;
    QSet<QString> m_pendingGroups;
};

} // namespace core
} // namespace dayplan
