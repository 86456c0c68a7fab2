#include "core/cache/cache_entry.h"

namespace vq {

QString tierKindToString(TierKind kind)
{
    switch (kind) {
    case TierKind::Memory:
        return QStringLiteral("memory");
    case TierKind::Persistent:
        return QStringLiteral("persistent");
    case TierKind::File:
        return QStringLiteral("file");
    }
    return QStringLiteral("file");
}

CacheEntry CacheEntry::forVideoStatus(const QString& videoId, int64_t createdAtMs)
{
    CacheEntry entry{CacheKey::videoStatus(videoId)};
    entry.processed = true;
    entry.createdAtMs = createdAtMs;
    return entry;
}

CacheEntry CacheEntry::forResponse(const CacheKey& key, const QString& response,
                                   int64_t createdAtMs)
{
    CacheEntry entry{key};
    entry.response = response;
    entry.createdAtMs = createdAtMs;
    return entry;
}

TierLookup TierLookup::hit(CacheEntry entry)
{
    TierLookup result;
    result.status = Status::Hit;
    result.entry = std::move(entry);
    return result;
}

TierLookup TierLookup::miss()
{
    return TierLookup{};
}

TierLookup TierLookup::failure(const QString& error)
{
    TierLookup result;
    result.status = Status::Error;
    result.error = error;
    return result;
}

} // namespace vq
