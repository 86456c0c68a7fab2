#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

namespace vq {

class QueryHistory;
class TimeSource;

struct ApproximateMatchConfig {
    double threshold = 0.5;                       // similarity must be strictly greater
    int64_t ttlMs = 24LL * 60 * 60 * 1000;
};

// Best-effort recovery from paraphrased-query misses: a linear scan over one
// video's non-expired query history, scored by Jaccard similarity of the
// whitespace token sets. Never reports an error; any failure reads as absent.
class ApproximateMatcher {
public:
    ApproximateMatcher(QueryHistory& history, const TimeSource& clock,
                       ApproximateMatchConfig config = {});

    std::optional<QString> findSimilar(const QString& videoId,
                                       const QString& normalizedQuery) const;

    // |A ∩ B| / |A ∪ B| over the distinct tokens. nullopt when either side
    // has no tokens.
    static std::optional<double> jaccardSimilarity(const QStringList& lhs,
                                                   const QStringList& rhs);

    const ApproximateMatchConfig& config() const { return m_config; }

private:
    QueryHistory& m_history;
    const TimeSource& m_clock;
    ApproximateMatchConfig m_config;
};

} // namespace vq
