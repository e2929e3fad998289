#include "dayplan/core/AppContext.hpp"

#include "dayplan/core/EditHistory.hpp"
#include "dayplan/core/Logging.hpp"
#include "dayplan/core/UpdateHook.hpp"
#include "dayplan/notify/CommandNotifier.hpp"
#include "dayplan/notify/NotificationScheduler.hpp"

#include <algorithm>

namespace dayplan {
namespace core {

AppContext::AppContext(Settings settings, std::unique_ptr<notify::Notifier> notifier, QObject *parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_notifier(std::move(notifier))
    , m_persistence(std::make_unique<data::PersistenceBridge>(m_settings.calendarDirectory, m_settings.cachePath))
    , m_history(std::make_unique<EditHistory>(static_cast<std::size_t>(m_settings.undoLimit)))
    , m_updateHook(std::make_unique<UpdateHook>())
    , m_snapEngine(m_settings.snapMinutes, m_settings.minimumDurationSeconds, m_settings.displayZone())
{
    if (!m_notifier) {
        m_notifier = std::make_unique<notify::CommandNotifier>(m_settings.notifierCommand);
    }
    m_scheduler = std::make_unique<notify::NotificationScheduler>(m_notifier.get());
    m_scheduler->setEnabled(m_settings.notifierEnabled);
    m_scheduler->setMaxWaitSeconds(m_settings.notifierMaxWaitSeconds);
    m_scheduler->setDisplayZone(m_settings.displayZone());
    m_scheduler->setBlacklistProcesses(m_settings.notifierBlacklistProcesses);

    m_updateHook->setCommand(m_settings.postUpdateCommand);
    m_updateHook->setDelay(m_settings.postUpdateDelayMs);

    m_history->setPersistenceSink(m_persistence.get());
    connect(m_history.get(), &EditHistory::eventsChanged, this, &AppContext::pushSnapshot);
    connect(m_history.get(), &EditHistory::eventsReloaded, this, &AppContext::pushSnapshot);
    connect(m_history.get(), &EditHistory::groupsPersisted, m_updateHook.get(), &UpdateHook::schedule);
}

AppContext::~AppContext()
{
    // The scheduler thread calls into the notifier; stop it first.
    m_scheduler->stop();
}

data::LoadReport AppContext::open()
{
    if (const auto error = m_persistence->open()) {
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Opening calendar failed:" << error->toString();
        data::LoadReport report;
        report.errors.push_back(*error);
        return report;
    }
    return refresh();
}

data::LoadReport AppContext::refresh()
{
    // Reloading replaces the in-memory state, so flush edits still waiting for disk first.
    std::optional<Error> pendingError = m_history->retryPendingWrites();
    if (pendingError) {
        const QStringList pending = m_history->pendingGroups();
        const bool onlyUnparsed = std::all_of(pending.cbegin(), pending.cend(), [this](const QString &group) {
            return m_persistence->isUnparsed(m_persistence->pathForGroup(group));
        });
        if (!onlyUnparsed) {
            qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Pending writes still failing, refresh skipped:" << pendingError->toString();
            data::LoadReport report;
            report.events = m_history->events();
            report.errors.push_back(*pendingError);
            return report;
        }
        // Edits to files another program left unreadable can never be written;
        // the file on disk wins once it parses again.
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Discarding edits to unreadable calendars" << pending;
    }
    data::LoadReport report = m_persistence->refresh();
    if (pendingError) {
        report.errors.push_back(*pendingError);
    }
    m_history->reload(report.events);
    return report;
}

std::vector<PlacedEvent> AppContext::eventsInRange(const QDateTime &from, const QDateTime &to) const
{
    std::vector<PlacedEvent> result;
    if (!from.isValid() || !to.isValid() || to < from) {
        return result;
    }
    const QTimeZone zone = m_snapEngine.displayZone();
    const QDate firstDay = from.toTimeZone(zone).date();
    const QDate lastDay = (to > from ? to.addMSecs(-1) : to).toTimeZone(zone).date();
    const qint64 rangeBegin = from.toMSecsSinceEpoch();
    const qint64 rangeEnd = std::max(to.toMSecsSinceEpoch(), rangeBegin + 1);

    for (PlacedEvent &placed : ColumnLayout::layoutDays(*m_history, firstDay, lastDay, zone)) {
        const qint64 segmentBegin = placed.segmentBegin.toMSecsSinceEpoch();
        const qint64 segmentEnd = std::max(placed.segmentEnd.toMSecsSinceEpoch(), segmentBegin + 1);
        if (segmentBegin < rangeEnd && rangeBegin < segmentEnd) {
            result.push_back(std::move(placed));
        }
    }
    return result;
}

DragProposal AppContext::proposeDrag(const QUuid &id,
                                     const QDateTime &pointer,
                                     DragMode mode,
                                     SnapPolicy policy,
                                     qint64 grabOffsetSeconds) const
{
    const auto source = m_history->findById(id);
    if (!source) {
        return DragProposal{};
    }
    return m_snapEngine.propose(*source, mode, pointer, policy, grabOffsetSeconds);
}

DragProposal AppContext::proposeCreate(const QDateTime &anchor, const QDateTime &pointer, SnapPolicy policy) const
{
    return m_snapEngine.proposeCreate(anchor, pointer, policy);
}

std::optional<Error> AppContext::commitDrag(const QUuid &id, DragMode mode, const DragProposal &proposal)
{
    if (!proposal.valid) {
        return Error::invalidRange(QStringLiteral("Drag proposal is not valid"));
    }
    const auto source = m_history->findById(id);
    if (!source) {
        return Error::notFound(QStringLiteral("No event with id %1").arg(id.toString()));
    }
    switch (mode) {
    case DragMode::Move:
        return m_history->commit(EditCommand::move(*source, proposal.begin, proposal.end));
    case DragMode::ResizeBegin:
    case DragMode::ResizeEnd:
        return m_history->commit(EditCommand::resize(*source, proposal.begin, proposal.end));
    case DragMode::Duplicate: {
        data::CalendarEvent copy = *source;
        copy.id = proposal.newEventId.isNull() ? QUuid::createUuid() : proposal.newEventId;
        copy.externalUid.clear();
        copy.begin = proposal.begin;
        copy.end = proposal.end;
        copy.completed = false;
        copy.created = QDateTime();
        copy.lastModified = QDateTime();
        return m_history->commit(EditCommand::create(copy));
    }
    }
    return Error::invalidRange(QStringLiteral("Unknown drag mode"));
}

std::optional<Error> AppContext::commitCreate(const QString &title, const DragProposal &proposal)
{
    if (!proposal.valid) {
        return Error::invalidRange(QStringLiteral("Drag proposal is not valid"));
    }
    data::CalendarEvent event;
    event.id = proposal.newEventId.isNull() ? QUuid::createUuid() : proposal.newEventId;
    event.title = title;
    event.begin = proposal.begin;
    event.end = proposal.end;
    event.group = m_settings.defaultGroup;
    return m_history->commit(EditCommand::create(event));
}

std::optional<Error> AppContext::commit(EditCommand command)
{
    return m_history->commit(std::move(command));
}

std::optional<Error> AppContext::undo()
{
    return m_history->undo();
}

std::optional<Error> AppContext::redo()
{
    return m_history->redo();
}

void AppContext::startScheduler()
{
    pushSnapshot();
    m_scheduler->start();
}

void AppContext::stopScheduler()
{
    m_scheduler->stop();
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

EditHistory &AppContext::history()
{
    return *m_history;
}

const EditHistory &AppContext::history() const
{
    return *m_history;
}

data::PersistenceBridge &AppContext::persistence()
{
    return *m_persistence;
}

notify::NotificationScheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

const SnapEngine &AppContext::snapEngine() const
{
    return m_snapEngine;
}

UpdateHook &AppContext::updateHook()
{
    return *m_updateHook;
}

void AppContext::pushSnapshot()
{
    m_scheduler->setEvents(notify::NotificationScheduler::snapshot(m_history->events()));
}

} // namespace core
} // namespace dayplan
