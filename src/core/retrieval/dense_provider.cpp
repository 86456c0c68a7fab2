#include "core/retrieval/dense_provider.h"

#include <utility>

namespace vq {

DenseSearchResult DenseSearchResult::success(std::vector<RankedCandidate> candidates)
{
    DenseSearchResult result;
    result.candidates = std::move(candidates);
    return result;
}

DenseSearchResult DenseSearchResult::failure(Status status, const QString& error)
{
    DenseSearchResult result;
    result.status = status;
    result.error = error;
    return result;
}

} // namespace vq
