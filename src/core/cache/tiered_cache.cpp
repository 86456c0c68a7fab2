#include "core/cache/tiered_cache.h"
#include "core/cache/approximate_matcher.h"
#include "core/cache/cache_tier.h"
#include "core/shared/logging.h"
#include "core/shared/time_source.h"

#include <algorithm>
#include <utility>

namespace vq {

TieredCacheManager::TieredCacheManager(std::vector<CacheTier*> tiers,
                                       const TimeSource& clock,
                                       ApproximateMatcher* matcher,
                                       TieredCacheConfig config)
    : m_tiers(std::move(tiers))
    , m_clock(clock)
    , m_matcher(matcher)
    , m_config(config)
{
    m_tiers.erase(std::remove(m_tiers.begin(), m_tiers.end(), nullptr), m_tiers.end());
    if (m_config.ttlMs <= 0) {
        LOG_WARN(vqCache, "Non-positive cache TTL %lld, using 24h",
                 static_cast<long long>(m_config.ttlMs));
        m_config.ttlMs = TieredCacheConfig{}.ttlMs;
    }
    m_stats.hitsByTier.assign(m_tiers.size(), 0);
}

std::optional<CacheEntry> TieredCacheManager::lookup(const CacheKey& key)
{
    const int64_t now = m_clock.nowMs();

    for (std::size_t i = 0; i < m_tiers.size(); ++i) {
        CacheTier* tier = m_tiers[i];
        TierLookup result = tier->get(key);

        if (result.isError()) {
            LOG_WARN(vqCache, "Cache tier '%s' read failed for %s: %s",
                     qUtf8Printable(tier->name()), qUtf8Printable(key.encoded()),
                     qUtf8Printable(result.error));
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_stats.tierErrors;
            continue;
        }
        if (!result.isHit() || !result.entry) {
            continue;
        }

        CacheEntry entry = std::move(*result.entry);
        if (!entry.isValidAt(now, m_config.ttlMs)) {
            LOG_DEBUG(vqCache, "Expired entry in tier '%s' for %s",
                      qUtf8Printable(tier->name()), qUtf8Printable(key.encoded()));
            continue;
        }
        entry.tierOfOrigin = tier->kind();

        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_stats.hitsByTier[i];
        }
        promote(i, entry);
        return entry;
    }

    std::lock_guard<std::mutex> lock(m_statsMutex);
    ++m_stats.misses;
    return std::nullopt;
}

void TieredCacheManager::promote(std::size_t hitIndex, const CacheEntry& entry)
{
    for (std::size_t i = 0; i < hitIndex; ++i) {
        if (!m_tiers[i]->set(entry)) {
            LOG_WARN(vqCache, "Promotion into tier '%s' failed for %s",
                     qUtf8Printable(m_tiers[i]->name()), qUtf8Printable(entry.key.encoded()));
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_stats.tierErrors;
            continue;
        }
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.promotions;
    }
}

bool TieredCacheManager::writeThrough(const CacheEntry& entry)
{
    if (m_tiers.empty()) {
        LOG_ERROR(vqCache, "No cache tiers configured; dropping write for %s",
                  qUtf8Printable(entry.key.encoded()));
        return false;
    }

    CacheTier* durable = m_tiers.back();
    if (!durable->set(entry)) {
        LOG_ERROR(vqCache, "Durable tier '%s' write failed for %s",
                  qUtf8Printable(durable->name()), qUtf8Printable(entry.key.encoded()));
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.durableWriteFailures;
        return false;
    }

    for (std::size_t i = 0; i + 1 < m_tiers.size(); ++i) {
        if (!m_tiers[i]->set(entry)) {
            LOG_WARN(vqCache, "Cache tier '%s' write failed for %s",
                     qUtf8Printable(m_tiers[i]->name()), qUtf8Printable(entry.key.encoded()));
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_stats.tierErrors;
        }
    }
    return true;
}

bool TieredCacheManager::hasProcessed(const QString& videoId)
{
    const std::optional<CacheEntry> entry = lookup(CacheKey::videoStatus(videoId));
    return entry.has_value() && entry->processed;
}

bool TieredCacheManager::markProcessed(const QString& videoId)
{
    return writeThrough(CacheEntry::forVideoStatus(videoId, m_clock.nowMs()));
}

std::optional<QString> TieredCacheManager::getResponse(const QString& videoId,
                                                       const QString& query)
{
    const CacheKey key = CacheKey::queryResponse(videoId, query);
    const std::optional<CacheEntry> entry = lookup(key);
    if (entry) {
        return entry->response;
    }

    if (!m_matcher) {
        return std::nullopt;
    }

    std::optional<QString> similar = m_matcher->findSimilar(videoId, key.normalizedQuery());
    if (similar) {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.approximateHits;
    }
    return similar;
}

bool TieredCacheManager::putResponse(const QString& videoId, const QString& query,
                                     const QString& response)
{
    const CacheKey key = CacheKey::queryResponse(videoId, query);
    return writeThrough(CacheEntry::forResponse(key, response, m_clock.nowMs()));
}

int TieredCacheManager::purgeExpired()
{
    const int64_t cutoff = m_clock.nowMs() - m_config.ttlMs;
    int removed = 0;
    for (CacheTier* tier : m_tiers) {
        const std::optional<int> count = tier->purgeExpired(cutoff);
        if (!count) {
            LOG_WARN(vqCache, "Purge failed in cache tier '%s'", qUtf8Printable(tier->name()));
            continue;
        }
        removed += *count;
    }
    LOG_INFO(vqCache, "Purged %d expired cache entries", removed);
    return removed;
}

TieredCacheManager::Stats TieredCacheManager::stats() const
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

} // namespace vq
