#pragma once

#include "core/cache/cache_tier.h"

#include <QString>

#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>

namespace vq {

class TimeSource;

struct MemoryTierConfig {
    int maxEntries = 1000;
    int64_t ttlMs = 24LL * 60 * 60 * 1000;
};

// Bounded in-process tier: LRU capacity plus TTL. Expired entries are
// evicted lazily when touched. Explicitly owned and injected, never global.
class MemoryTier : public CacheTier {
public:
    MemoryTier(const TimeSource& clock, MemoryTierConfig config = {});

    TierKind kind() const override { return TierKind::Memory; }
    TierLookup get(const CacheKey& key) override;
    bool set(const CacheEntry& entry) override;

    std::optional<int> purgeExpired(int64_t cutoffMs) override;

    bool remove(const CacheKey& key);
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    struct Slot {
        QString key;
        CacheEntry entry;
    };

    const TimeSource& m_clock;
    MemoryTierConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Slot> m_list;  // front = most recently used

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::list<Slot>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
    uint64_t m_expirations = 0;
};

} // namespace vq
