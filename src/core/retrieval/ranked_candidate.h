#pragma once

#include "core/shared/passage.h"

namespace vq {

// One entry of a single-signal ranked list, before fusion. Not persisted.
struct RankedCandidate {
    Passage passage;
    double sourceScore = 0.0;   // raw signal (BM25 score, cosine similarity, ...)
    int rank = 0;               // zero-based position in its source list
};

} // namespace vq
