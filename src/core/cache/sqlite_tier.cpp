#include "core/cache/sqlite_tier.h"
#include "core/cache/sqlite_schema.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

namespace vq {

namespace {

constexpr const char* kValueTypeBool = "bool";
constexpr const char* kValueTypeText = "text";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return {};
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text),
                             sqlite3_column_bytes(stmt, column));
}

} // namespace

SqliteTier::~SqliteTier()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SqliteTier> SqliteTier::open(const QString& dbPath)
{
    SqliteTier tier;
    if (!tier.init(dbPath)) {
        return std::nullopt;
    }
    return tier;
}

bool SqliteTier::init(const QString& dbPath)
{
    const QString parentDir = QFileInfo(dbPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vqCache, "Failed to create cache database directory: %s",
                  qUtf8Printable(parentDir));
        return false;
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(vqCache, "Failed to open cache database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(vqCache, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='cache_entries'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(vqCache, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kCacheSchemaV1)) {
            LOG_ERROR(vqCache, "Failed to create cache schema");
            return false;
        }
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(vqCache, "Cache database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SqliteTier::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(vqCache, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

int SqliteTier::stepWithRetry(sqlite3_stmt* stmt)
{
    // busy_timeout does not cover every SQLITE_BUSY case under WAL (e.g. a
    // checkpoint racing a writer), so retry a few times at this level.
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(20 * attempt);
        }
        rc = sqlite3_step(stmt);
    }
    return rc;
}

TierLookup SqliteTier::get(const CacheKey& key)
{
    if (!m_db) {
        return TierLookup::failure(QStringLiteral("database not open"));
    }

    const char* sql =
        "SELECT value_type, value, created_at, normalized_query "
        "FROM cache_entries WHERE cache_key = ?1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        const QString error = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return TierLookup::failure(error);
    }

    const QByteArray keyUtf8 = key.encoded().toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return TierLookup::miss();
    }
    if (rc != SQLITE_ROW) {
        const QString error = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return TierLookup::failure(error);
    }

    const QString valueType = columnText(stmt, 0);
    const QString value = columnText(stmt, 1);
    const int64_t createdAt = sqlite3_column_int64(stmt, 2);
    const QString storedQuery = columnText(stmt, 3);
    sqlite3_finalize(stmt);

    CacheEntry entry{key};
    entry.createdAtMs = createdAt;
    entry.tierOfOrigin = TierKind::Persistent;

    if (key.kind() == CacheKind::VideoStatus) {
        if (valueType != QLatin1String(kValueTypeBool)) {
            return TierLookup::failure(
                QStringLiteral("malformed video-status row for %1").arg(key.encoded()));
        }
        entry.processed = (value == QLatin1String("1"));
        return entry.processed ? TierLookup::hit(std::move(entry)) : TierLookup::miss();
    }

    if (valueType != QLatin1String(kValueTypeText)) {
        return TierLookup::failure(
            QStringLiteral("malformed query-response row for %1").arg(key.encoded()));
    }
    if (!storedQuery.isEmpty() && storedQuery != key.normalizedQuery()) {
        // Fingerprint collision between two different queries.
        return TierLookup::miss();
    }
    entry.response = value;
    return TierLookup::hit(std::move(entry));
}

bool SqliteTier::set(const CacheEntry& entry)
{
    if (!m_db) {
        return false;
    }

    const char* sql = R"(
        INSERT INTO cache_entries (cache_key, kind, video_id, normalized_query,
                                   value_type, value, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(cache_key) DO UPDATE SET
            kind = excluded.kind,
            video_id = excluded.video_id,
            normalized_query = excluded.normalized_query,
            value_type = excluded.value_type,
            value = excluded.value,
            created_at = excluded.created_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(vqCache, "cache set prepare failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return false;
    }

    const bool isVideo = entry.key.kind() == CacheKind::VideoStatus;
    const QByteArray keyUtf8 = entry.key.encoded().toUtf8();
    const QByteArray kindUtf8 = cacheKindToString(entry.key.kind()).toUtf8();
    const QByteArray videoUtf8 = entry.key.videoId().toUtf8();
    const QByteArray queryUtf8 = entry.key.normalizedQuery().toUtf8();
    const QByteArray valueUtf8 = isVideo
        ? QByteArray(entry.processed ? "1" : "0")
        : entry.response.toUtf8();

    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, kindUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, videoUtf8.constData(), -1, SQLITE_STATIC);
    if (isVideo) {
        sqlite3_bind_null(stmt, 4);
    } else {
        sqlite3_bind_text(stmt, 4, queryUtf8.constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_text(stmt, 5, isVideo ? kValueTypeBool : kValueTypeText, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, valueUtf8.constData(), valueUtf8.size(), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 7, entry.createdAtMs);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(vqCache, "cache set step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool SqliteTier::exists(const CacheKey& key)
{
    if (!m_db) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT 1 FROM cache_entries WHERE cache_key = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return false;
    }
    const QByteArray keyUtf8 = key.encoded().toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    const bool found = stepWithRetry(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

bool SqliteTier::remove(const CacheKey& key)
{
    if (!m_db) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM cache_entries WHERE cache_key = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(vqCache, "cache remove prepare failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return false;
    }
    const QByteArray keyUtf8 = key.encoded().toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::optional<int> SqliteTier::purgeExpired(int64_t cutoffMs)
{
    if (!m_db) {
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM cache_entries WHERE created_at <= ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(vqCache, "cache purge prepare failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, cutoffMs);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(vqCache, "cache purge failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_changes(m_db);
}

int SqliteTier::count() const
{
    if (!m_db) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    int result = 0;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM cache_entries", -1, &stmt, nullptr)
            == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

} // namespace vq
