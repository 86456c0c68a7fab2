#pragma once

#include "core/cache/cache_entry.h"

#include <QString>
#include <cstdint>
#include <optional>

namespace vq {

// Uniform storage primitive over one backing tier. No cross-tier logic.
// Tiers do not judge TTL validity; they return what they hold together
// with its created_at and let the caller decide.
class CacheTier {
public:
    virtual ~CacheTier() = default;

    virtual TierKind kind() const = 0;
    virtual TierLookup get(const CacheKey& key) = 0;
    virtual bool set(const CacheEntry& entry) = 0;

    virtual bool exists(const CacheKey& key) { return get(key).isHit(); }

    // Physically drop entries created at or before cutoffMs. Returns the
    // number removed, or nullopt on failure. Tiers that keep expired records
    // (readers treat them as absent) remove nothing.
    virtual std::optional<int> purgeExpired(int64_t cutoffMs)
    {
        Q_UNUSED(cutoffMs);
        return 0;
    }

    QString name() const { return tierKindToString(kind()); }
};

// Enumerates every stored query record for one video, expired records
// included. Returns nullopt when the history cannot be listed at all.
class QueryHistory {
public:
    virtual ~QueryHistory() = default;
    virtual std::optional<QueryHistoryScan> queryHistory(const QString& videoId) = 0;
};

} // namespace vq
