#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QThread>
#include <QTimeZone>
#include <QUuid>
#include <QWaitCondition>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "dayplan/core/Error.hpp"
#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace notify {

class Notifier;

// Immutable copy of the fields the scheduler needs from an event.
struct ScheduledEvent
{
    QUuid id;
    QString title;
    QString notes;
    QDateTime begin;
    QDateTime end;
};

struct NotificationMessage
{
    QString title;
    QString body;
    QDateTime fireTime;
};

// Fires one notification per event when its begin time arrives. A background
// thread sleeps until the earliest pending begin (never longer than the
// maximum wait) or until the event set changes.
class NotificationScheduler
{
public:
    using Clock = std::function<QDateTime()>;
    using ProcessLister = std::function<QStringList()>;

    explicit NotificationScheduler(Notifier *notifier);
    ~NotificationScheduler();

    NotificationScheduler(const NotificationScheduler &) = delete;
    NotificationScheduler &operator=(const NotificationScheduler &) = delete;

    void setClock(Clock clock);
    void setEnabled(bool enabled);
    void setMaxWaitSeconds(int seconds);
    void setDisplayZone(const QTimeZone &zone);
    // Due events are still marked notified while a listed process runs, but
    // nothing is shown.
    void setBlacklistProcesses(const QStringList &names);
    void setProcessLister(ProcessLister lister);

    // Replaces the watched set and wakes the thread to recompute its deadline.
    void setEvents(const std::vector<ScheduledEvent> &events);
    static std::vector<ScheduledEvent> snapshot(const std::vector<data::CalendarEvent> &events);

    // Fires everything due now. Returns the number of events marked notified.
    int recheck();
    std::optional<QDateTime> nextWake() const;
    bool isNotified(const QUuid &id) const;
    bool isArmed(const QUuid &id) const;

    void start();
    void stop();
    bool isRunning() const;

    // Names of the running processes as listed in /proc/<pid>/comm.
    static QStringList runningProcessNames();
    static NotificationMessage composeMessage(const ScheduledEvent &event, const QTimeZone &zone);
    static std::optional<core::Error> detectClockAnomaly(const QDateTime &wallBefore,
                                                         const QDateTime &wallAfter,
                                                         qint64 monotonicElapsedMs);

private:
    struct Entry
    {
        ScheduledEvent event;
        bool armed = false;
        bool notified = false;
    };

    void run();
    std::optional<QDateTime> nextWakeLocked() const;

    Notifier *m_notifier = nullptr;
    Clock m_clock;
    ProcessLister m_processLister;
    QStringList m_blacklist;
    bool m_enabled = true;
    int m_maxWaitSeconds = 60;
    QTimeZone m_displayZone = QTimeZone::systemTimeZone();

    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    QHash<QUuid, Entry> m_entries;
    QDateTime m_lastCheck;
    quint64 m_generation = 0;
    bool m_stopping = false;
    std::unique_ptr<QThread> m_thread;
};

} // namespace notify
} // namespace dayplan
