#include "core/cache/memory_tier.h"
#include "core/shared/time_source.h"

#include <algorithm>

namespace vq {

MemoryTier::MemoryTier(const TimeSource& clock, MemoryTierConfig config)
    : m_clock(clock)
    , m_config(config)
{
    m_config.maxEntries = std::max(1, m_config.maxEntries);
}

TierLookup MemoryTier::get(const CacheKey& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key.encoded());
    if (it == m_index.end()) {
        ++m_misses;
        return TierLookup::miss();
    }

    if (!it->second->entry.isValidAt(m_clock.nowMs(), m_config.ttlMs)) {
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_expirations;
        ++m_misses;
        return TierLookup::miss();
    }

    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    CacheEntry entry = it->second->entry;
    entry.tierOfOrigin = TierKind::Memory;
    return TierLookup::hit(std::move(entry));
}

bool MemoryTier::set(const CacheEntry& entry)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QString& cacheKey = entry.key.encoded();
    auto existing = m_index.find(cacheKey);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        const auto& back = m_list.back();
        m_index.erase(back.key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({cacheKey, entry});
    m_index[cacheKey] = m_list.begin();
    return true;
}

bool MemoryTier::remove(const CacheKey& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(key.encoded());
    if (it == m_index.end()) {
        return false;
    }
    m_list.erase(it->second);
    m_index.erase(it);
    return true;
}

std::optional<int> MemoryTier::purgeExpired(int64_t cutoffMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int removed = 0;
    for (auto it = m_list.begin(); it != m_list.end();) {
        if (it->entry.createdAtMs <= cutoffMs) {
            m_index.erase(it->key);
            it = m_list.erase(it);
            ++m_expirations;
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryTier::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

MemoryTier::Stats MemoryTier::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, m_expirations, static_cast<int>(m_list.size())};
}

} // namespace vq
