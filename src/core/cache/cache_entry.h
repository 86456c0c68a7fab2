#pragma once

#include "core/cache/cache_key.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace vq {

enum class TierKind {
    Memory,
    Persistent,
    File,
};

QString tierKindToString(TierKind kind);

// A stored value plus the time it was first written. Video-status entries use
// `processed`; query-response entries use `response`.
struct CacheEntry {
    CacheKey key;
    bool processed = false;
    QString response;
    int64_t createdAtMs = 0;
    TierKind tierOfOrigin = TierKind::File;

    // Valid iff now - created_at < ttl.
    bool isValidAt(int64_t nowMs, int64_t ttlMs) const
    {
        return nowMs - createdAtMs < ttlMs;
    }

    static CacheEntry forVideoStatus(const QString& videoId, int64_t createdAtMs);
    static CacheEntry forResponse(const CacheKey& key, const QString& response,
                                  int64_t createdAtMs);
};

// Persisted form of one answered query, enumerable per video.
struct QueryRecord {
    QString videoId;
    QString normalizedQuery;
    QString response;
    int64_t createdAtMs = 0;
};

// Result of a single-tier read. A miss is not an error.
struct TierLookup {
    enum class Status {
        Hit,
        Miss,
        Error,
    };

    Status status = Status::Miss;
    std::optional<CacheEntry> entry;
    QString error;

    bool isHit() const { return status == Status::Hit; }
    bool isError() const { return status == Status::Error; }

    static TierLookup hit(CacheEntry entry);
    static TierLookup miss();
    static TierLookup failure(const QString& error);
};

// A video's enumerated query history. `unreadable` counts records that were
// present but could not be parsed; they are excluded from `records`.
struct QueryHistoryScan {
    std::vector<QueryRecord> records;
    int unreadable = 0;
};

} // namespace vq
