#include "dayplan/data/PersistenceBridge.hpp"

#include "dayplan/core/Logging.hpp"
#include "dayplan/data/IcsCodec.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>
#include <QSet>

namespace dayplan {
namespace data {

namespace {
constexpr auto FILE_SUFFIX = ".ics";
} // namespace

PersistenceBridge::PersistenceBridge(QString directory, QString cachePath)
    : m_directory(std::move(directory))
    , m_cache(std::move(cachePath))
{
}

PersistenceBridge::~PersistenceBridge() = default;

std::optional<core::Error> PersistenceBridge::open()
{
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return core::Error::persistenceWriteFailed(m_directory, QStringLiteral("cannot create calendar directory"));
    }
    return m_cache.open();
}

LoadReport PersistenceBridge::load()
{
    LoadReport report;
    QSet<QString> seen;
    QHash<QString, QString> groupPaths;
    QSet<QString> unparsed;

    const QDir dir(m_directory);
    const QFileInfoList files = dir.entryInfoList({ QStringLiteral("*%1").arg(QLatin1String(FILE_SUFFIX)) },
                                                  QDir::Files | QDir::Readable,
                                                  QDir::Name);
    for (const QFileInfo &info : files) {
        const QString path = info.absoluteFilePath();
        // The file name is the group as-is, so saves land back in this file.
        const QString group = info.completeBaseName();
        seen.insert(path);
        groupPaths.insert(group, path);
        const FileFingerprint current = FileFingerprint::of(info);

        const auto stored = m_cache.fingerprint(path);
        if (stored && *stored == current) {
            core::Error cacheError;
            if (auto document = m_cache.document(path, &cacheError)) {
                qCDebug(DAYPLAN_PERSISTENCE_LOG) << "Unchanged, served from cache:" << path;
                report.cachedFiles << path;
                for (CalendarEvent &event : document->events) {
                    event.group = group;
                    report.events.push_back(std::move(event));
                }
                continue;
            }
            qCDebug(DAYPLAN_PERSISTENCE_LOG) << "Cache entry unusable, re-parsing" << path << cacheError.toString();
        }

        core::Error parseError;
        auto document = readFile(path, group, &parseError);
        if (!document) {
            qCWarning(DAYPLAN_PERSISTENCE_LOG) << parseError.toString();
            report.errors.push_back(parseError);
            unparsed.insert(path);
            // The last good state of the file stays visible.
            for (CacheRecord &record : m_cache.recordsForPath(path)) {
                record.event.group = group;
                report.events.push_back(std::move(record.event));
            }
            continue;
        }

        report.parsedFiles << path;
        if (const auto cacheError = m_cache.replaceFile(path, current, *document)) {
            qCWarning(DAYPLAN_CACHE_LOG) << "Cache update failed for" << path << cacheError->toString();
        }
        for (CalendarEvent &event : document->events) {
            report.events.push_back(std::move(event));
        }
    }

    const QStringList known = m_cache.knownPaths();
    for (const QString &path : known) {
        if (seen.contains(path)) {
            continue;
        }
        if (const auto error = m_cache.purgeFile(path)) {
            qCWarning(DAYPLAN_CACHE_LOG) << "Purging vanished file failed" << path << error->toString();
            continue;
        }
        report.purgedFiles << path;
    }

    {
        QMutexLocker locker(&m_stateGuard);
        m_groupPaths.swap(groupPaths);
        m_unparsedPaths.swap(unparsed);
    }

    qCInfo(DAYPLAN_PERSISTENCE_LOG) << "Loaded" << report.events.size() << "events from" << m_directory
                                    << "parsed:" << report.parsedFiles.size()
                                    << "cached:" << report.cachedFiles.size()
                                    << "purged:" << report.purgedFiles.size()
                                    << "errors:" << report.errors.size();
    return report;
}

LoadReport PersistenceBridge::refresh()
{
    return load();
}

std::optional<CalendarDocument> PersistenceBridge::readFile(const QString &path, const QString &group, core::Error *error) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = core::Error::parseFailed(path, file.errorString());
        return std::nullopt;
    }
    const QString text = QString::fromUtf8(file.readAll());

    core::Error codecError;
    auto document = IcsCodec::parse(text, group, &codecError);
    if (!document) {
        *error = core::Error::parseFailed(path, codecError.cause);
        return std::nullopt;
    }
    return document;
}

std::optional<core::Error> PersistenceBridge::writeGroup(const QString &group, const std::vector<CalendarEvent> &events)
{
    const QString path = pathForGroup(group);
    QMutexLocker locker(mutexForPath(path));

    if (isUnparsed(path)) {
        // Whatever another program put in there is only known to that program.
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Not overwriting unreadable file" << path;
        return core::Error::persistenceWriteFailed(path, QStringLiteral("file failed to parse on last load"));
    }

    if (events.empty()) {
        QFile file(path);
        if (file.exists() && !file.remove()) {
            qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Failed to remove" << path << file.errorString();
            return core::Error::persistenceWriteFailed(path, file.errorString());
        }
        if (const auto cacheError = m_cache.purgeFile(path)) {
            qCWarning(DAYPLAN_CACHE_LOG) << "Purging removed group failed" << path << cacheError->toString();
        }
        qCDebug(DAYPLAN_PERSISTENCE_LOG) << "Removed empty group file" << path;
        return std::nullopt;
    }

    if (!QDir().mkpath(m_directory)) {
        return core::Error::persistenceWriteFailed(path, QStringLiteral("cannot create calendar directory"));
    }

    CalendarDocument document;
    // Calendar level lines written by other programs survive our rewrite.
    if (m_cache.fingerprint(path)) {
        if (auto previous = m_cache.document(path)) {
            document.extraLines = previous->extraLines;
        }
    }
    document.events = events;
    for (CalendarEvent &event : document.events) {
        event.group = group;
        // The file keeps whole seconds; the cache must hold what a re-parse yields.
        event.begin = wholeSeconds(event.begin);
        event.end = wholeSeconds(event.end);
        event.created = wholeSeconds(event.created);
        event.lastModified = wholeSeconds(event.lastModified);
    }

    const QByteArray bytes = IcsCodec::serialize(document).toUtf8();
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Cannot open" << path << "for writing:" << file.errorString();
        return core::Error::persistenceWriteFailed(path, file.errorString());
    }
    if (file.write(bytes) != bytes.size()) {
        const QString cause = file.errorString();
        file.cancelWriting();
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Short write to" << path << cause;
        return core::Error::persistenceWriteFailed(path, cause);
    }
    if (!file.commit()) {
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << "Committing" << path << "failed:" << file.errorString();
        return core::Error::persistenceWriteFailed(path, file.errorString());
    }

    // The file is durable now; a stale cache only costs a re-parse on the next load.
    const FileFingerprint fp = FileFingerprint::of(QFileInfo(path));
    if (const auto cacheError = m_cache.replaceFile(path, fp, document)) {
        qCWarning(DAYPLAN_CACHE_LOG) << "Cache update after write failed" << path << cacheError->toString();
    }
    {
        QMutexLocker stateLocker(&m_stateGuard);
        m_groupPaths.insert(group, path);
    }
    qCDebug(DAYPLAN_PERSISTENCE_LOG) << "Wrote" << document.events.size() << "events to" << path;
    return std::nullopt;
}

QString PersistenceBridge::directory() const
{
    return m_directory;
}

QString PersistenceBridge::pathForGroup(const QString &group) const
{
    {
        QMutexLocker locker(&m_stateGuard);
        const auto it = m_groupPaths.constFind(group);
        if (it != m_groupPaths.constEnd()) {
            return it.value();
        }
    }
    return QDir(m_directory).absoluteFilePath(normalizeGroup(group) + QLatin1String(FILE_SUFFIX));
}

bool PersistenceBridge::isUnparsed(const QString &path) const
{
    QMutexLocker locker(&m_stateGuard);
    return m_unparsedPaths.contains(path);
}

CacheStore &PersistenceBridge::cache()
{
    return m_cache;
}

const CacheStore &PersistenceBridge::cache() const
{
    return m_cache;
}

QMutex *PersistenceBridge::mutexForPath(const QString &path)
{
    QMutexLocker locker(&m_pathMutexesGuard);
    auto &mutex = m_pathMutexes[path];
    if (!mutex) {
        mutex = std::make_shared<QMutex>();
    }
    return mutex.get();
}

} // namespace data
} // namespace dayplan
