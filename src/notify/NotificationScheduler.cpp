#include "dayplan/notify/NotificationScheduler.hpp"

#include "dayplan/core/Logging.hpp"
#include "dayplan/notify/Notifier.hpp"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QMutexLocker>
#include <algorithm>
#include <cstdlib>

namespace dayplan {
namespace notify {

namespace {
constexpr qint64 ClockSkewToleranceMs = 2000;
constexpr auto TIME_FORMAT = "HH:mm";
} // namespace

NotificationScheduler::NotificationScheduler(Notifier *notifier)
    : m_notifier(notifier)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
    , m_processLister(&NotificationScheduler::runningProcessNames)
{
}

NotificationScheduler::~NotificationScheduler()
{
    stop();
}

void NotificationScheduler::setClock(Clock clock)
{
    QMutexLocker locker(&m_mutex);
    m_clock = std::move(clock);
}

void NotificationScheduler::setEnabled(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_enabled = enabled;
}

void NotificationScheduler::setMaxWaitSeconds(int seconds)
{
    QMutexLocker locker(&m_mutex);
    m_maxWaitSeconds = std::max(1, seconds);
    ++m_generation;
    m_condition.wakeAll();
}

void NotificationScheduler::setDisplayZone(const QTimeZone &zone)
{
    QMutexLocker locker(&m_mutex);
    m_displayZone = zone.isValid() ? zone : QTimeZone::systemTimeZone();
}

void NotificationScheduler::setBlacklistProcesses(const QStringList &names)
{
    QMutexLocker locker(&m_mutex);
    m_blacklist = names;
}

void NotificationScheduler::setProcessLister(ProcessLister lister)
{
    QMutexLocker locker(&m_mutex);
    m_processLister = std::move(lister);
}

QStringList NotificationScheduler::runningProcessNames()
{
    QStringList names;
    const QDir proc(QStringLiteral("/proc"));
    const QStringList entries = proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &entry : entries) {
        bool isPid = false;
        entry.toLongLong(&isPid);
        if (!isPid) {
            continue;
        }
        // Processes may exit between listing and reading.
        QFile comm(proc.filePath(entry + QStringLiteral("/comm")));
        if (!comm.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QString name = QString::fromLocal8Bit(comm.readAll()).trimmed();
        if (!name.isEmpty()) {
            names << name;
        }
    }
    return names;
}

void NotificationScheduler::setEvents(const std::vector<ScheduledEvent> &events)
{
    QMutexLocker locker(&m_mutex);
    const QDateTime now = m_clock();

    QHash<QUuid, Entry> entries;
    entries.reserve(static_cast<int>(events.size()));
    for (const ScheduledEvent &event : events) {
        Entry entry;
        entry.event = event;
        const auto previous = m_entries.constFind(event.id);
        if (previous == m_entries.constEnd()) {
            entry.armed = event.begin > now;
        } else if (previous->event.begin != event.begin) {
            // A moved event fires again at its new time, unless that is already past.
            entry.armed = event.begin > now;
            entry.notified = false;
        } else {
            entry.armed = previous->armed || event.begin > now;
            entry.notified = previous->notified;
        }
        entries.insert(event.id, entry);
    }
    m_entries.swap(entries);
    ++m_generation;
    m_condition.wakeAll();
    qCDebug(DAYPLAN_SCHEDULER_LOG) << "Watching" << m_entries.size() << "events";
}

std::vector<ScheduledEvent> NotificationScheduler::snapshot(const std::vector<data::CalendarEvent> &events)
{
    std::vector<ScheduledEvent> scheduled;
    scheduled.reserve(events.size());
    for (const data::CalendarEvent &event : events) {
        scheduled.push_back({ event.id, event.title, event.notes, event.begin, event.end });
    }
    return scheduled;
}

int NotificationScheduler::recheck()
{
    std::vector<ScheduledEvent> due;
    bool deliver = true;
    QTimeZone zone;
    Notifier *notifier = nullptr;
    QStringList blacklist;
    ProcessLister lister;
    {
        QMutexLocker locker(&m_mutex);
        const QDateTime now = m_clock();
        if (m_lastCheck.isValid() && now < m_lastCheck) {
            const auto anomaly = detectClockAnomaly(m_lastCheck, now, 0);
            qCWarning(DAYPLAN_SCHEDULER_LOG) << anomaly->toString();
        }
        m_lastCheck = now;

        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            Entry &entry = it.value();
            if (!entry.armed && entry.event.begin > now) {
                entry.armed = true;
            }
            if (entry.armed && !entry.notified && entry.event.begin <= now) {
                entry.notified = true;
                due.push_back(entry.event);
            }
        }
        deliver = m_enabled;
        zone = m_displayZone;
        notifier = m_notifier;
        blacklist = m_blacklist;
        lister = m_processLister;
    }

    if (deliver && !due.empty() && !blacklist.isEmpty() && lister) {
        const QStringList running = lister();
        const auto blocking = std::find_if(blacklist.cbegin(), blacklist.cend(), [&running](const QString &name) {
            return running.contains(name);
        });
        if (blocking != blacklist.cend()) {
            qCInfo(DAYPLAN_SCHEDULER_LOG) << "Suppressing" << due.size() << "notifications while" << *blocking << "runs";
            deliver = false;
        }
    }

    std::sort(due.begin(), due.end(), [](const ScheduledEvent &lhs, const ScheduledEvent &rhs) {
        return lhs.begin < rhs.begin;
    });
    for (const ScheduledEvent &event : due) {
        if (!deliver || !notifier) {
            qCDebug(DAYPLAN_SCHEDULER_LOG) << "Not delivering, marking" << event.title << "as notified";
            continue;
        }
        const NotificationMessage message = composeMessage(event, zone);
        notifier->notify(message.title, message.body, message.fireTime);
    }
    return static_cast<int>(due.size());
}

std::optional<QDateTime> NotificationScheduler::nextWake() const
{
    QMutexLocker locker(&m_mutex);
    return nextWakeLocked();
}

std::optional<QDateTime> NotificationScheduler::nextWakeLocked() const
{
    std::optional<QDateTime> wake;
    for (const Entry &entry : m_entries) {
        if (!entry.armed || entry.notified) {
            continue;
        }
        if (!wake || entry.event.begin < *wake) {
            wake = entry.event.begin;
        }
    }
    return wake;
}

bool NotificationScheduler::isNotified(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_entries.constFind(id);
    return it != m_entries.constEnd() && it->notified;
}

bool NotificationScheduler::isArmed(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_entries.constFind(id);
    return it != m_entries.constEnd() && it->armed;
}

void NotificationScheduler::start()
{
    if (m_thread) {
        return;
    }
    {
        QMutexLocker locker(&m_mutex);
        m_stopping = false;
    }
    m_thread.reset(QThread::create([this] { run(); }));
    m_thread->setObjectName(QStringLiteral("dayplan-scheduler"));
    m_thread->start();
    qCDebug(DAYPLAN_SCHEDULER_LOG) << "Scheduler thread started";
}

void NotificationScheduler::stop()
{
    if (!m_thread) {
        return;
    }
    {
        QMutexLocker locker(&m_mutex);
        m_stopping = true;
        ++m_generation;
        m_condition.wakeAll();
    }
    m_thread->wait();
    m_thread.reset();
    qCDebug(DAYPLAN_SCHEDULER_LOG) << "Scheduler thread stopped";
}

bool NotificationScheduler::isRunning() const
{
    return m_thread && m_thread->isRunning();
}

void NotificationScheduler::run()
{
    QMutexLocker locker(&m_mutex);
    while (!m_stopping) {
        const quint64 generation = m_generation;
        locker.unlock();
        recheck();
        locker.relock();
        if (m_stopping) {
            break;
        }
        if (generation != m_generation) {
            // Events changed while we were firing; look again before sleeping.
            continue;
        }

        const QDateTime before = m_clock();
        const auto wake = nextWakeLocked();
        QElapsedTimer monotonic;
        monotonic.start();
        if (!wake) {
            qCDebug(DAYPLAN_SCHEDULER_LOG) << "Nothing pending, waiting for changes";
            m_condition.wait(&m_mutex);
            continue;
        }

        const qint64 maxWaitMs = static_cast<qint64>(m_maxWaitSeconds) * 1000;
        const qint64 untilWake = std::max<qint64>(0, before.msecsTo(*wake) + 1);
        const qint64 waitMs = std::min(untilWake, maxWaitMs);
        qCDebug(DAYPLAN_SCHEDULER_LOG) << "Next wake at" << *wake << "sleeping" << waitMs << "ms";
        const bool signalled = m_condition.wait(&m_mutex, static_cast<unsigned long>(waitMs));
        if (signalled || generation != m_generation) {
            continue;
        }
        if (const auto anomaly = detectClockAnomaly(before, m_clock(), monotonic.elapsed())) {
            qCWarning(DAYPLAN_SCHEDULER_LOG) << anomaly->toString();
        }
    }
}

NotificationMessage NotificationScheduler::composeMessage(const ScheduledEvent &event, const QTimeZone &zone)
{
    NotificationMessage message;
    message.title = QStringLiteral("Time for %1").arg(event.title);
    const QString begin = event.begin.toTimeZone(zone).toString(QLatin1String(TIME_FORMAT));
    if (event.end.isValid() && event.end > event.begin) {
        message.body = QStringLiteral("%1 - %2").arg(begin, event.end.toTimeZone(zone).toString(QLatin1String(TIME_FORMAT)));
    } else {
        message.body = begin;
    }
    if (!event.notes.isEmpty()) {
        message.body += QLatin1Char('\n');
        message.body += event.notes;
    }
    message.fireTime = event.begin;
    return message;
}

std::optional<core::Error> NotificationScheduler::detectClockAnomaly(const QDateTime &wallBefore,
                                                                     const QDateTime &wallAfter,
                                                                     qint64 monotonicElapsedMs)
{
    const qint64 wallElapsedMs = wallBefore.msecsTo(wallAfter);
    if (wallElapsedMs < 0) {
        return core::Error::clockAnomaly(QStringLiteral("Wall clock went backwards by %1 ms").arg(-wallElapsedMs));
    }
    const qint64 skew = wallElapsedMs - monotonicElapsedMs;
    if (std::abs(skew) > ClockSkewToleranceMs) {
        return core::Error::clockAnomaly(QStringLiteral("Wall clock moved %1 ms while %2 ms elapsed")
                                             .arg(wallElapsedMs)
                                             .arg(monotonicElapsedMs));
    }
    return std::nullopt;
}

} // namespace notify
} // namespace dayplan
