#pragma once

#include <QFileInfo>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVariant>
#include <optional>
#include <vector>

#include "dayplan/core/Error.hpp"
#include "dayplan/data/IcsCodec.hpp"

namespace dayplan {
namespace data {

// Modification time and size of a calendar file as seen when it was parsed.
struct FileFingerprint
{
    qint64 mtimeMs = -1;
    qint64 size = -1;

    static FileFingerprint of(const QFileInfo &info);

    bool operator==(const FileFingerprint &other) const;
    bool operator!=(const FileFingerprint &other) const { return !(*this == other); }
};

// One cached event together with the file it came from.
struct CacheRecord
{
    QString path;
    CalendarEvent event;
};

// SQLite cache of parsed calendar files, keyed by file path. A file whose
// fingerprint is unchanged is served from here instead of being re-parsed.
class CacheStore
{
public:
    explicit CacheStore(QString databasePath);
    ~CacheStore();

    CacheStore(const CacheStore &) = delete;
    CacheStore &operator=(const CacheStore &) = delete;

    std::optional<core::Error> open();
    bool isOpen() const;
    QString databasePath() const;

    std::optional<FileFingerprint> fingerprint(const QString &path) const;
    std::optional<CalendarDocument> document(const QString &path, core::Error *error = nullptr) const;
    std::vector<CacheRecord> recordsForPath(const QString &path) const;
    std::optional<CacheRecord> recordForEvent(const QUuid &id) const;
    std::vector<CacheRecord> allRecords() const;
    QStringList knownPaths() const;
    std::size_t eventCount() const;

    // Replaces everything cached for path in one transaction.
    std::optional<core::Error> replaceFile(const QString &path,
                                           const FileFingerprint &fingerprint,
                                           const CalendarDocument &document);
    std::optional<core::Error> purgeFile(const QString &path);

private:
    std::optional<core::Error> createTables();
    core::Error failure(const QString &cause) const;
    std::vector<CacheRecord> selectRecords(const QString &where, const QVariant &value) const;

    QString m_databasePath;
    QSqlDatabase m_db;
};

} // namespace data
} // namespace dayplan
