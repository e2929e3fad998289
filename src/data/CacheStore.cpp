#include "dayplan/data/CacheStore.hpp"

#include "dayplan/core/Logging.hpp"

#include <QDateTime>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>
#include <QVariant>

namespace dayplan {
namespace data {

namespace {
constexpr auto LINE_SEPARATOR = "\n";

QVariant msecsOrNull(const QDateTime &dt)
{
    return dt.isValid() ? QVariant(dt.toMSecsSinceEpoch()) : QVariant(QVariant::LongLong);
}

QDateTime dateTimeOrInvalid(const QVariant &value)
{
    if (value.isNull()) {
        return {};
    }
    return QDateTime::fromMSecsSinceEpoch(value.toLongLong(), Qt::UTC);
}

QStringList splitLines(const QString &joined)
{
    if (joined.isEmpty()) {
        return {};
    }
    return joined.split(QLatin1String(LINE_SEPARATOR));
}
} // namespace

FileFingerprint FileFingerprint::of(const QFileInfo &info)
{
    FileFingerprint fp;
    if (!info.exists()) {
        return fp;
    }
    fp.mtimeMs = info.lastModified().toMSecsSinceEpoch();
    fp.size = info.size();
    return fp;
}

bool FileFingerprint::operator==(const FileFingerprint &other) const
{
    return mtimeMs == other.mtimeMs && size == other.size;
}

CacheStore::CacheStore(QString databasePath)
    : m_databasePath(std::move(databasePath))
{
}

CacheStore::~CacheStore()
{
    if (m_db.isOpen()) {
        m_db.close();
    }
    const auto connection = m_db.connectionName();
    m_db = {};
    if (!connection.isEmpty() && QSqlDatabase::contains(connection)) {
        QSqlDatabase::removeDatabase(connection);
    }
}

std::optional<core::Error> CacheStore::open()
{
    if (m_db.isOpen()) {
        return std::nullopt;
    }
    // One connection per store so that several stores can live in one process.
    const auto connectionName = QStringLiteral("dayplan-cache-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
    m_db.setDatabaseName(m_databasePath);
    if (!m_db.open()) {
        const auto error = failure(m_db.lastError().text());
        qCWarning(DAYPLAN_CACHE_LOG) << "Failed to open cache" << m_databasePath << error.cause;
        return error;
    }
    qCDebug(DAYPLAN_CACHE_LOG) << "Opened cache at" << m_databasePath;
    return createTables();
}

bool CacheStore::isOpen() const
{
    return m_db.isOpen();
}

QString CacheStore::databasePath() const
{
    return m_databasePath;
}

std::optional<core::Error> CacheStore::createTables()
{
    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral(R"SQL(
        CREATE TABLE IF NOT EXISTS files (
            path TEXT PRIMARY KEY,
            mtime_ms INTEGER NOT NULL,
            size INTEGER NOT NULL,
            extra TEXT NOT NULL DEFAULT ''
        )
    )SQL"))) {
        return failure(query.lastError().text());
    }
    if (!query.exec(QStringLiteral(R"SQL(
        CREATE TABLE IF NOT EXISTS events (
            path TEXT NOT NULL REFERENCES files(path) ON DELETE CASCADE,
            event_id TEXT NOT NULL,
            uid TEXT NOT NULL DEFAULT '',
            title TEXT NOT NULL DEFAULT '',
            notes TEXT NOT NULL DEFAULT '',
            begin_ms INTEGER NOT NULL,
            end_ms INTEGER NOT NULL,
            grp TEXT NOT NULL,
            completed INTEGER NOT NULL DEFAULT 0,
            created_ms INTEGER,
            modified_ms INTEGER,
            extra TEXT NOT NULL DEFAULT '',
            PRIMARY KEY (path, event_id)
        )
    )SQL"))) {
        return failure(query.lastError().text());
    }
    for (const auto &statement : { QStringLiteral("CREATE INDEX IF NOT EXISTS events_id ON events(event_id)"),
                                   QStringLiteral("CREATE INDEX IF NOT EXISTS events_begin ON events(begin_ms)") }) {
        if (!query.exec(statement)) {
            return failure(query.lastError().text());
        }
    }
    return std::nullopt;
}

core::Error CacheStore::failure(const QString &cause) const
{
    return core::Error::persistenceWriteFailed(m_databasePath, cause);
}

std::optional<FileFingerprint> CacheStore::fingerprint(const QString &path) const
{
    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("SELECT mtime_ms, size FROM files WHERE path = ?"));
    query.addBindValue(path);
    if (!query.exec()) {
        qCWarning(DAYPLAN_CACHE_LOG) << "Fingerprint lookup failed for" << path << query.lastError().text();
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }
    FileFingerprint fp;
    fp.mtimeMs = query.value(0).toLongLong();
    fp.size = query.value(1).toLongLong();
    return fp;
}

std::optional<CalendarDocument> CacheStore::document(const QString &path, core::Error *error) const
{
    auto fail = [&](const QString &cause) -> std::optional<CalendarDocument> {
        qCWarning(DAYPLAN_CACHE_LOG) << "Cache read failed for" << path << cause;
        if (error) {
            *error = core::Error::parseFailed(path, cause);
        }
        return std::nullopt;
    };

    CalendarDocument document;
    QSqlQuery files(m_db);
    files.prepare(QStringLiteral("SELECT extra FROM files WHERE path = ?"));
    files.addBindValue(path);
    if (!files.exec()) {
        return fail(files.lastError().text());
    }
    if (!files.next()) {
        return fail(QStringLiteral("no cache entry"));
    }
    document.extraLines = splitLines(files.value(0).toString());

    for (CacheRecord &record : recordsForPath(path)) {
        document.events.push_back(std::move(record.event));
    }
    return document;
}

std::vector<CacheRecord> CacheStore::selectRecords(const QString &where, const QVariant &value) const
{
    std::vector<CacheRecord> records;
    QSqlQuery query(m_db);
    query.prepare(QStringLiteral(R"SQL(
        SELECT path, event_id, uid, title, notes, begin_ms, end_ms, grp, completed, created_ms, modified_ms, extra
        FROM events
    )SQL") + where + QStringLiteral(" ORDER BY begin_ms, event_id"));
    if (value.isValid()) {
        query.addBindValue(value);
    }
    if (!query.exec()) {
        qCWarning(DAYPLAN_CACHE_LOG) << "Reading cached events failed" << query.lastError().text();
        return records;
    }
    while (query.next()) {
        CacheRecord record;
        record.path = query.value(0).toString();
        CalendarEvent &event = record.event;
        event.id = QUuid(query.value(1).toString());
        event.externalUid = query.value(2).toString();
        event.title = query.value(3).toString();
        event.notes = query.value(4).toString();
        event.begin = QDateTime::fromMSecsSinceEpoch(query.value(5).toLongLong(), Qt::UTC);
        event.end = QDateTime::fromMSecsSinceEpoch(query.value(6).toLongLong(), Qt::UTC);
        event.group = query.value(7).toString();
        event.completed = query.value(8).toInt() != 0;
        event.created = dateTimeOrInvalid(query.value(9));
        event.lastModified = dateTimeOrInvalid(query.value(10));
        event.extraProperties = splitLines(query.value(11).toString());
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<CacheRecord> CacheStore::recordsForPath(const QString &path) const
{
    return selectRecords(QStringLiteral(" WHERE path = ?"), path);
}

std::optional<CacheRecord> CacheStore::recordForEvent(const QUuid &id) const
{
    auto records = selectRecords(QStringLiteral(" WHERE event_id = ?"), id.toString(QUuid::WithoutBraces));
    if (records.empty()) {
        return std::nullopt;
    }
    return std::move(records.front());
}

std::vector<CacheRecord> CacheStore::allRecords() const
{
    return selectRecords(QString(), QVariant());
}

QStringList CacheStore::knownPaths() const
{
    QStringList paths;
    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral("SELECT path FROM files ORDER BY path"))) {
        qCWarning(DAYPLAN_CACHE_LOG) << "Listing cached files failed" << query.lastError().text();
        return paths;
    }
    while (query.next()) {
        paths << query.value(0).toString();
    }
    return paths;
}

std::size_t CacheStore::eventCount() const
{
    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM events")) || !query.next()) {
        qCWarning(DAYPLAN_CACHE_LOG) << "Counting cached events failed" << query.lastError().text();
        return 0;
    }
    return static_cast<std::size_t>(query.value(0).toLongLong());
}

std::optional<core::Error> CacheStore::replaceFile(const QString &path,
                                                   const FileFingerprint &fingerprint,
                                                   const CalendarDocument &document)
{
    if (!m_db.transaction()) {
        return failure(m_db.lastError().text());
    }

    auto rollback = [&](const QSqlQuery &query) -> std::optional<core::Error> {
        const auto error = failure(query.lastError().text());
        qCWarning(DAYPLAN_CACHE_LOG) << "Replacing cache entry for" << path << "failed:" << error.cause;
        m_db.rollback();
        return error;
    };

    QSqlQuery clear(m_db);
    clear.prepare(QStringLiteral("DELETE FROM events WHERE path = ?"));
    clear.addBindValue(path);
    if (!clear.exec()) {
        return rollback(clear);
    }

    QSqlQuery upsert(m_db);
    upsert.prepare(QStringLiteral(R"SQL(
        INSERT INTO files (path, mtime_ms, size, extra) VALUES (?, ?, ?, ?)
        ON CONFLICT(path) DO UPDATE SET mtime_ms = excluded.mtime_ms, size = excluded.size, extra = excluded.extra
    )SQL"));
    upsert.addBindValue(path);
    upsert.addBindValue(fingerprint.mtimeMs);
    upsert.addBindValue(fingerprint.size);
    upsert.addBindValue(document.extraLines.join(QLatin1String(LINE_SEPARATOR)));
    if (!upsert.exec()) {
        return rollback(upsert);
    }

    QSqlQuery insert(m_db);
    insert.prepare(QStringLiteral(R"SQL(
        INSERT OR REPLACE INTO events
            (path, event_id, uid, title, notes, begin_ms, end_ms, grp, completed, created_ms, modified_ms, extra)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL"));
    for (const CalendarEvent &event : document.events) {
        insert.bindValue(0, path);
        insert.bindValue(1, event.id.toString(QUuid::WithoutBraces));
        insert.bindValue(2, event.externalUid);
        insert.bindValue(3, event.title);
        insert.bindValue(4, event.notes);
        insert.bindValue(5, event.beginMs());
        insert.bindValue(6, event.endMs());
        insert.bindValue(7, event.group);
        insert.bindValue(8, event.completed ? 1 : 0);
        insert.bindValue(9, msecsOrNull(event.created));
        insert.bindValue(10, msecsOrNull(event.lastModified));
        insert.bindValue(11, event.extraProperties.join(QLatin1String(LINE_SEPARATOR)));
        if (!insert.exec()) {
            return rollback(insert);
        }
    }

    if (!m_db.commit()) {
        const auto error = failure(m_db.lastError().text());
        m_db.rollback();
        return error;
    }
    qCDebug(DAYPLAN_CACHE_LOG) << "Cached" << document.events.size() << "events from" << path;
    return std::nullopt;
}

std::optional<core::Error> CacheStore::purgeFile(const QString &path)
{
    if (!m_db.transaction()) {
        return failure(m_db.lastError().text());
    }
    for (const auto &statement : { QStringLiteral("DELETE FROM events WHERE path = ?"),
                                   QStringLiteral("DELETE FROM files WHERE path = ?") }) {
        QSqlQuery query(m_db);
        query.prepare(statement);
        query.addBindValue(path);
        if (!query.exec()) {
            const auto error = failure(query.lastError().text());
            m_db.rollback();
            return error;
        }
    }
    if (!m_db.commit()) {
        const auto error = failure(m_db.lastError().text());
        m_db.rollback();
        return error;
    }
    qCDebug(DAYPLAN_CACHE_LOG) << "Purged" << path;
    return std::nullopt;
}

} // namespace data
} // namespace dayplan
