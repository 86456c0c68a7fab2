#pragma once

#include "core/retrieval/ranked_candidate.h"

#include <QString>
#include <vector>

namespace vq {

struct DenseSearchResult {
    enum class Status {
        Ok,
        Unavailable,
        TimedOut,
    };

    Status status = Status::Ok;
    std::vector<RankedCandidate> candidates;   // best first
    QString error;

    bool ok() const { return status == Status::Ok; }

    static DenseSearchResult success(std::vector<RankedCandidate> candidates);
    static DenseSearchResult failure(Status status, const QString& error);
};

// External embedding / vector-search collaborator, namespaced per video.
// Implementations own their timeout and report it as Status::TimedOut.
class DenseSimilarityProvider {
public:
    virtual ~DenseSimilarityProvider() = default;
    virtual DenseSearchResult similaritySearch(const QString& videoId,
                                               const QString& query,
                                               int k) = 0;
};

} // namespace vq
