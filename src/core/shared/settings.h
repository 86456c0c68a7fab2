#pragma once

#include <QString>
#include <cstdint>

namespace vq {

// What hybrid search does when the dense provider errors or times out.
enum class DenseFailurePolicy {
    DegradeToLexical,
    Fail,
};

QString denseFailurePolicyToString(DenseFailurePolicy policy);
DenseFailurePolicy denseFailurePolicyFromString(const QString& str);

struct Settings {
    // Cache storage root (memory tier is not persisted)
    QString cacheDir;

    // Cache lifetime, applied uniformly to every tier
    int64_t cacheTtlSeconds = 86400;         // 24 hours
    int memoryCacheMaxEntries = 1000;

    // Approximate match
    double similarityThreshold = 0.5;

    // Retrieval
    int defaultTopK = 4;
    int summaryTopK = 20;
    double hybridVectorWeight = 0.7;
    DenseFailurePolicy denseFailurePolicy = DenseFailurePolicy::DegradeToLexical;
};

} // namespace vq
