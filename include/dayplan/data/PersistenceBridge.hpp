#pragma once

#include <QHash>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

#include "dayplan/core/Error.hpp"
#include "dayplan/core/PersistenceSink.hpp"
#include "dayplan/data/CacheStore.hpp"
#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace data {

struct LoadReport
{
    std::vector<CalendarEvent> events;
    // One ParseFailed per file that could not be read; their prior cache
    // entries are part of events.
    std::vector<core::Error> errors;
    QStringList parsedFiles;
    QStringList cachedFiles;
    QStringList purgedFiles;

    bool hasErrors() const { return !errors.empty(); }
};

// Keeps a directory of per-group .ics files and the SQLite cache mirroring
// them in step.
class PersistenceBridge : public core::PersistenceSink
{
public:
    PersistenceBridge(QString directory, QString cachePath);
    ~PersistenceBridge() override;

    std::optional<core::Error> open();

    // Reconciles the directory with the cache and returns the full event set.
    LoadReport load();
    LoadReport refresh();

    std::optional<core::Error> writeGroup(const QString &group, const std::vector<CalendarEvent> &events) override;

    QString directory() const;
    // Groups loaded from disk map to the file they came from; new groups get
    // a file named after their normalized name.
    QString pathForGroup(const QString &group) const;
    // True for files whose last load failed to parse. Writes to them are
    // refused until a later load reads them cleanly.
    bool isUnparsed(const QString &path) const;
    CacheStore &cache();
    const CacheStore &cache() const;

private:
    std::optional<CalendarDocument> readFile(const QString &path, const QString &group, core::Error *error) const;
    QMutex *mutexForPath(const QString &path);

    QString m_directory;
    CacheStore m_cache;
    mutable QMutex m_stateGuard;
    QHash<QString, QString> m_groupPaths;
    QSet<QString> m_unparsedPaths;
    QMutex m_pathMutexesGuard;
    QHash<QString, std::shared_ptr<QMutex>> m_pathMutexes;
};

} // namespace data
} // namespace dayplan
