#pragma once

#include "core/cache/cache_entry.h"

#include <QString>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace vq {

class ApproximateMatcher;
class CacheTier;
class TimeSource;

struct TieredCacheConfig {
    int64_t ttlMs = 24LL * 60 * 60 * 1000;
};

// TieredCacheManager -- read-through / write-through over an ordered list of
// tiers, fastest first. The LAST tier is the durable source of truth.
//
// Reads probe tiers in order; the first valid (unexpired) hit is promoted
// into every faster tier with its original created_at, so promotion never
// extends an entry's lifetime. Writes go to the durable tier first and then
// to the faster tiers; only a durable-tier write failure is reported.
// Errors from non-durable tiers are logged and swallowed.
class TieredCacheManager {
public:
    // Tiers are borrowed and must outlive the manager. `matcher` may be null
    // (exact lookups only).
    TieredCacheManager(std::vector<CacheTier*> tiers,
                       const TimeSource& clock,
                       ApproximateMatcher* matcher = nullptr,
                       TieredCacheConfig config = {});

    bool hasProcessed(const QString& videoId);
    bool markProcessed(const QString& videoId);

    // Exact lookup, then approximate fallback. nullopt only after both miss.
    std::optional<QString> getResponse(const QString& videoId, const QString& query);
    bool putResponse(const QString& videoId, const QString& query, const QString& response);

    // Drop expired entries from every tier that supports physical removal.
    // Returns the number of entries removed.
    int purgeExpired();

    // Ordered probe with promotion. Returned entry carries the tier it was
    // found in.
    std::optional<CacheEntry> lookup(const CacheKey& key);

    const std::vector<CacheTier*>& tiers() const { return m_tiers; }
    int64_t ttlMs() const { return m_config.ttlMs; }

    struct Stats {
        std::vector<uint64_t> hitsByTier;   // same order as tiers()
        uint64_t misses = 0;
        uint64_t approximateHits = 0;
        uint64_t promotions = 0;
        uint64_t tierErrors = 0;
        uint64_t durableWriteFailures = 0;
    };
    Stats stats() const;

private:
    void promote(std::size_t hitIndex, const CacheEntry& entry);
    bool writeThrough(const CacheEntry& entry);

    std::vector<CacheTier*> m_tiers;
    const TimeSource& m_clock;
    ApproximateMatcher* m_matcher = nullptr;
    TieredCacheConfig m_config;

    mutable std::mutex m_statsMutex;
    Stats m_stats;
};

} // namespace vq
