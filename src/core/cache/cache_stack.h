#pragma once

#include "core/cache/approximate_matcher.h"
#include "core/cache/file_tier.h"
#include "core/cache/memory_tier.h"
#include "core/cache/sqlite_tier.h"
#include "core/cache/tiered_cache.h"
#include "core/shared/settings.h"

#include <QString>

#include <memory>

namespace vq {

class TimeSource;

// CacheStack -- owns the standard memory -> SQLite -> file tier chain for one
// cache directory and the manager that fronts it.
//
// Layout under cacheDir:
//   cache.db           persistent key-value tier
//   videos/, queries/  flat-file tier (durable source of truth)
//
// An unusable cache.db is skipped and the stack runs on memory + files.
class CacheStack {
    struct PrivateTag {};

public:
    // Returns nullptr only when the file tier cannot be initialized.
    static std::unique_ptr<CacheStack> open(const Settings& settings, const TimeSource& clock);

    explicit CacheStack(PrivateTag) {}

    TieredCacheManager& manager() { return *m_manager; }
    MemoryTier& memoryTier() { return *m_memory; }
    // nullptr when the persistent tier could not be opened.
    SqliteTier* sqliteTier() { return m_sqlite.get(); }
    FileTier& fileTier() { return *m_files; }

    static QString databasePath(const QString& cacheDir);

private:

    std::unique_ptr<MemoryTier> m_memory;
    std::unique_ptr<SqliteTier> m_sqlite;
    std::unique_ptr<FileTier> m_files;
    std::unique_ptr<ApproximateMatcher> m_matcher;
    std::unique_ptr<TieredCacheManager> m_manager;
};

} // namespace vq
