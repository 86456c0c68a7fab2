#include "core/cache/cache_stack.h"
#include "core/shared/logging.h"

#include <utility>

namespace vq {

QString CacheStack::databasePath(const QString& cacheDir)
{
    return cacheDir + QStringLiteral("/cache.db");
}

std::unique_ptr<CacheStack> CacheStack::open(const Settings& settings, const TimeSource& clock)
{
    const int64_t ttlMs = settings.cacheTtlSeconds * 1000;

    auto stack = std::make_unique<CacheStack>(PrivateTag{});

    auto files = std::make_unique<FileTier>(settings.cacheDir);
    if (!files->initialize()) {
        LOG_ERROR(vqCache, "File cache tier unavailable at %s", qUtf8Printable(settings.cacheDir));
        return nullptr;
    }

    std::optional<SqliteTier> sqlite = SqliteTier::open(databasePath(settings.cacheDir));
    if (!sqlite) {
        LOG_WARN(vqCache, "Persistent cache tier unavailable at %s, continuing without it",
                 qUtf8Printable(databasePath(settings.cacheDir)));
    }

    MemoryTierConfig memoryConfig;
    memoryConfig.maxEntries = settings.memoryCacheMaxEntries;
    memoryConfig.ttlMs = ttlMs;

    ApproximateMatchConfig matchConfig;
    matchConfig.threshold = settings.similarityThreshold;
    matchConfig.ttlMs = ttlMs;

    TieredCacheConfig cacheConfig;
    cacheConfig.ttlMs = ttlMs;

    stack->m_memory = std::make_unique<MemoryTier>(clock, memoryConfig);
    if (sqlite) {
        stack->m_sqlite = std::make_unique<SqliteTier>(std::move(*sqlite));
    }
    stack->m_files = std::move(files);
    stack->m_matcher = std::make_unique<ApproximateMatcher>(*stack->m_files, clock, matchConfig);

    std::vector<CacheTier*> tiers{stack->m_memory.get()};
    if (stack->m_sqlite) {
        tiers.push_back(stack->m_sqlite.get());
    }
    tiers.push_back(stack->m_files.get());
    stack->m_manager = std::make_unique<TieredCacheManager>(
        std::move(tiers), clock, stack->m_matcher.get(), cacheConfig);

    LOG_INFO(vqCache, "Cache stack ready at %s (%d tiers, ttl %llds)",
             qUtf8Printable(settings.cacheDir),
             static_cast<int>(stack->m_manager->tiers().size()),
             static_cast<long long>(settings.cacheTtlSeconds));
    return stack;
}

} // namespace vq
