#include "core/cache/approximate_matcher.h"
#include "core/cache/cache_tier.h"
#include "core/shared/logging.h"
#include "core/shared/text_tokens.h"
#include "core/shared/time_source.h"

#include <QSet>

namespace vq {

ApproximateMatcher::ApproximateMatcher(QueryHistory& history, const TimeSource& clock,
                                       ApproximateMatchConfig config)
    : m_history(history)
    , m_clock(clock)
    , m_config(config)
{
}

std::optional<double> ApproximateMatcher::jaccardSimilarity(const QStringList& lhs,
                                                            const QStringList& rhs)
{
    const QSet<QString> left(lhs.begin(), lhs.end());
    const QSet<QString> right(rhs.begin(), rhs.end());
    if (left.isEmpty() || right.isEmpty()) {
        return std::nullopt;
    }

    int intersection = 0;
    for (const QString& token : left) {
        if (right.contains(token)) {
            ++intersection;
        }
    }
    const int unionSize = left.size() + right.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

std::optional<QString> ApproximateMatcher::findSimilar(const QString& videoId,
                                                       const QString& normalizedQuery) const
{
    const QStringList queryTokens = tokenize(normalizedQuery);
    if (queryTokens.isEmpty()) {
        return std::nullopt;
    }

    const std::optional<QueryHistoryScan> scan = m_history.queryHistory(videoId);
    if (!scan) {
        LOG_WARN(vqCache, "Approximate match skipped: query history unavailable for %s",
                 qUtf8Printable(videoId));
        return std::nullopt;
    }

    const int64_t now = m_clock.nowMs();
    const QueryRecord* best = nullptr;
    double bestScore = m_config.threshold;

    for (const QueryRecord& record : scan->records) {
        if (now - record.createdAtMs >= m_config.ttlMs) {
            continue;
        }
        if (record.response.isEmpty()) {
            continue;
        }

        const std::optional<double> similarity =
            jaccardSimilarity(queryTokens, tokenize(record.normalizedQuery));
        if (!similarity) {
            continue;
        }
        if (*similarity > bestScore) {
            bestScore = *similarity;
            best = &record;
        }
    }

    if (!best) {
        return std::nullopt;
    }

    LOG_DEBUG(vqCache, "Approximate match for '%s' -> '%s' (%.3f)",
              qUtf8Printable(normalizedQuery), qUtf8Printable(best->normalizedQuery),
              bestScore);
    return best->response;
}

} // namespace vq
