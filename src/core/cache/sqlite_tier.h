#pragma once

#include "core/cache/cache_tier.h"

#include <QString>
#include <cstdint>
#include <optional>

#include <sqlite3.h>

namespace vq {

// SqliteTier -- persistent key-value tier backed by one SQLite table.
// The connection is opened in serialized (full mutex) mode so the tier can
// be shared across request threads.
class SqliteTier : public CacheTier {
public:
    ~SqliteTier() override;

    // Move-only (owns sqlite3* handle)
    SqliteTier(SqliteTier&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SqliteTier& operator=(SqliteTier&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SqliteTier(const SqliteTier&) = delete;
    SqliteTier& operator=(const SqliteTier&) = delete;

    // Open or create the database at the given path.
    static std::optional<SqliteTier> open(const QString& dbPath);

    TierKind kind() const override { return TierKind::Persistent; }
    TierLookup get(const CacheKey& key) override;
    bool set(const CacheEntry& entry) override;
    bool exists(const CacheKey& key) override;

    bool remove(const CacheKey& key);

    std::optional<int> purgeExpired(int64_t cutoffMs) override;

    int count() const;

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    SqliteTier() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    int stepWithRetry(sqlite3_stmt* stmt);

    sqlite3* m_db = nullptr;
};

} // namespace vq
