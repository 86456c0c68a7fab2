#pragma once

#include "core/retrieval/ranked_candidate.h"

#include <vector>

namespace vq {

struct FusionConfig {
    double vectorWeight = 0.7;   // lexical weight is 1 - vectorWeight
    int maxResults = 4;
};

enum class MergeCategory {
    Both,
    DenseOnly,
    LexicalOnly,
};

struct FusedCandidate {
    Passage passage;
    double denseScore = 0.0;
    double lexicalScore = 0.0;
    double fusedScore = 0.0;
    MergeCategory category = MergeCategory::DenseOnly;
};

// HybridMerger -- fuses a dense and a lexical ranked list by position.
//
// Each list is normalized independently by rank: the item at zero-based
// position i of a list of length N scores 1 - i/N, so raw cosine and BM25
// magnitudes never need calibrating against each other. Passages are
// deduplicated by exact text; a side where a passage is absent contributes 0.
// Candidates whose fused score is 0 (present only on a zero-weighted side)
// are dropped.
class HybridMerger {
public:
    static std::vector<FusedCandidate> merge(
        const std::vector<RankedCandidate>& denseResults,
        const std::vector<RankedCandidate>& lexicalResults,
        FusionConfig config = {});

    static double positionScore(int position, int listLength);
};

} // namespace vq
