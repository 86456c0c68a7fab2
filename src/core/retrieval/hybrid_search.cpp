#include "core/retrieval/hybrid_search.h"
#include "core/retrieval/dense_provider.h"
#include "core/retrieval/lexical_index_builder.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace vq {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

const char* denseStatusName(DenseSearchResult::Status status)
{
    switch (status) {
    case DenseSearchResult::Status::Ok:
        return "ok";
    case DenseSearchResult::Status::Unavailable:
        return "unavailable";
    case DenseSearchResult::Status::TimedOut:
        return "timed out";
    }
    return "unknown";
}

} // namespace

bool DenseCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open: allow a half-open probe once the cooldown has elapsed
    const int64_t lastFail = lastFailureTime.load();
    if (steadyNowMs() - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void DenseCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void DenseCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

HybridSearchEngine::HybridSearchEngine(DenseSimilarityProvider* dense,
                                       LexicalIndexBuilder& lexical,
                                       DenseFailurePolicy failurePolicy)
    : m_dense(dense)
    , m_lexical(lexical)
    , m_failurePolicy(failurePolicy)
{
}

HybridSearchResult HybridSearchEngine::hybridSearch(const QString& videoId,
                                                    const QString& query,
                                                    int k,
                                                    double vectorWeight)
{
    HybridSearchResult result;
    if (k <= 0) {
        return result;
    }

    double effectiveWeight = std::clamp(vectorWeight, 0.0, 1.0);

    // 1. Dense candidates
    std::vector<RankedCandidate> denseCandidates;
    QString denseError;
    if (!m_dense) {
        denseError = QStringLiteral("no dense similarity provider configured");
    } else if (m_circuitBreaker.isOpen()) {
        denseError = QStringLiteral("dense similarity circuit open");
    } else {
        DenseSearchResult dense = m_dense->similaritySearch(videoId, query, k);
        if (dense.ok()) {
            m_circuitBreaker.recordSuccess();
            denseCandidates = std::move(dense.candidates);
            if (static_cast<int>(denseCandidates.size()) > k) {
                denseCandidates.resize(static_cast<std::size_t>(k));
            }
        } else {
            m_circuitBreaker.recordFailure();
            denseError = QStringLiteral("dense similarity %1: %2")
                             .arg(QString::fromLatin1(denseStatusName(dense.status)), dense.error);
        }
    }

    if (!denseError.isEmpty()) {
        if (m_failurePolicy == DenseFailurePolicy::Fail) {
            LOG_WARN(vqRetrieval, "Hybrid search failed for %s: %s",
                     qUtf8Printable(videoId), qUtf8Printable(denseError));
            result.status = HybridSearchResult::Status::Failed;
            result.denseDegraded = true;
            result.error = denseError;
            return result;
        }
        LOG_WARN(vqRetrieval, "Degrading to lexical-only search for %s: %s",
                 qUtf8Printable(videoId), qUtf8Printable(denseError));
        result.denseDegraded = true;
        result.error = denseError;
        effectiveWeight = 0.0;
    }

    // 2. Lexical candidates; a missing index is built from the dense hits.
    std::vector<Passage> lazyPassages;
    lazyPassages.reserve(denseCandidates.size());
    for (const RankedCandidate& candidate : denseCandidates) {
        lazyPassages.push_back(candidate.passage);
    }
    const std::vector<RankedCandidate> lexicalCandidates =
        m_lexical.search(videoId, query, k, lazyPassages);

    // 3-5. Position-normalize, fuse, top k
    FusionConfig config;
    config.vectorWeight = effectiveWeight;
    config.maxResults = k;
    const std::vector<FusedCandidate> fused =
        HybridMerger::merge(denseCandidates, lexicalCandidates, config);

    for (const FusedCandidate& candidate : fused) {
        result.passages.append(candidate.passage.text);
    }

    if (result.passages.isEmpty()) {
        LOG_INFO(vqRetrieval, "No context available for %s", qUtf8Printable(videoId));
        result.status = HybridSearchResult::Status::NoContext;
    } else {
        result.status = HybridSearchResult::Status::Ok;
    }
    return result;
}

} // namespace vq
