#pragma once

#include <QDateTime>
#include <QObject>
#include <QUuid>
#include <memory>
#include <optional>
#include <vector>

#include "dayplan/core/ColumnLayout.hpp"
#include "dayplan/core/EditCommand.hpp"
#include "dayplan/core/Error.hpp"
#include "dayplan/core/Settings.hpp"
#include "dayplan/core/SnapEngine.hpp"
#include "dayplan/data/PersistenceBridge.hpp"

namespace dayplan {
namespace notify {
class Notifier;
class NotificationScheduler;
}

namespace core {

class EditHistory;
class UpdateHook;

// Wires the calendar core together: persistence feeds the edit history,
// whose changes fan out to the scheduler and the post-update hook.
class AppContext : public QObject
{
    Q_OBJECT

public:
    explicit AppContext(Settings settings,
                        std::unique_ptr<notify::Notifier> notifier = nullptr,
                        QObject *parent = nullptr);
    ~AppContext() override;

    // Opens the calendar directory and cache and loads every event.
    data::LoadReport open();
    data::LoadReport refresh();

    std::vector<PlacedEvent> eventsInRange(const QDateTime &from, const QDateTime &to) const;

    DragProposal proposeDrag(const QUuid &id,
                             const QDateTime &pointer,
                             DragMode mode,
                             SnapPolicy policy,
                             qint64 grabOffsetSeconds = 0) const;
    DragProposal proposeCreate(const QDateTime &anchor, const QDateTime &pointer, SnapPolicy policy) const;
    // Turns an accepted proposal into the matching edit command and commits it.
    std::optional<Error> commitDrag(const QUuid &id, DragMode mode, const DragProposal &proposal);
    std::optional<Error> commitCreate(const QString &title, const DragProposal &proposal);

    std::optional<Error> commit(EditCommand command);
    std::optional<Error> undo();
    std::optional<Error> redo();

    void startScheduler();
    void stopScheduler();

    const Settings &settings() const;
    EditHistory &history();
    const EditHistory &history() const;
    data::PersistenceBridge &persistence();
    notify::NotificationScheduler &scheduler();
    const SnapEngine &snapEngine() const;
    UpdateHook &updateHook();

private:
    void pushSnapshot();

    Settings m_settings;
    std::unique_ptr<notify::Notifier> m_notifier;
    std::unique_ptr<data::PersistenceBridge> m_persistence;
    std::unique_ptr<EditHistory> m_history;
    std::unique_ptr<notify::NotificationScheduler> m_scheduler;
    std::unique_ptr<UpdateHook> m_updateHook;
    SnapEngine m_snapEngine;
};

} // namespace core
} // namespace dayplan
