#pragma once

#include "core/retrieval/hybrid_merger.h"
#include "core/shared/settings.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <cstdint>

namespace vq {

class DenseSimilarityProvider;
class LexicalIndexBuilder;

struct DenseCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct HybridSearchResult {
    enum class Status {
        Ok,
        NoContext,   // neither signal produced a passage; not an error
        Failed,      // dense provider failed under DenseFailurePolicy::Fail
    };

    Status status = Status::NoContext;
    QStringList passages;        // best first, contents only
    bool denseDegraded = false;  // dense signal was skipped or failed
    QString error;

    bool hasContext() const { return status == Status::Ok && !passages.isEmpty(); }
};

// HybridSearchEngine -- dense + lexical retrieval fused per video.
class HybridSearchEngine {
public:
    // `dense` may be null, in which case every search is lexical-only.
    HybridSearchEngine(DenseSimilarityProvider* dense,
                       LexicalIndexBuilder& lexical,
                       DenseFailurePolicy failurePolicy = DenseFailurePolicy::DegradeToLexical);

    HybridSearchResult hybridSearch(const QString& videoId,
                                    const QString& query,
                                    int k,
                                    double vectorWeight);

    // Expose for testing
    DenseCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    DenseSimilarityProvider* m_dense = nullptr;
    LexicalIndexBuilder& m_lexical;
    DenseFailurePolicy m_failurePolicy;
    DenseCircuitBreaker m_circuitBreaker;
};

} // namespace vq
