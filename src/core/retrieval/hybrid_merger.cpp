#include "core/retrieval/hybrid_merger.h"

#include <QHash>
#include <QSet>
#include <QString>

#include <algorithm>
#include <utility>

namespace vq {

double HybridMerger::positionScore(int position, int listLength)
{
    if (listLength <= 0 || position < 0 || position >= listLength) {
        return 0.0;
    }
    return 1.0 - static_cast<double>(position) / static_cast<double>(listLength);
}

std::vector<FusedCandidate> HybridMerger::merge(
    const std::vector<RankedCandidate>& denseResults,
    const std::vector<RankedCandidate>& lexicalResults,
    FusionConfig config)
{
    const double vectorWeight = std::clamp(config.vectorWeight, 0.0, 1.0);
    const double lexicalWeight = 1.0 - vectorWeight;

    // Discovery order: dense list first, then lexical-only additions.
    std::vector<FusedCandidate> merged;
    merged.reserve(denseResults.size() + lexicalResults.size());
    QHash<QString, std::size_t> slotByText;

    const int denseCount = static_cast<int>(denseResults.size());
    for (int i = 0; i < denseCount; ++i) {
        const Passage& passage = denseResults[static_cast<std::size_t>(i)].passage;
        if (slotByText.contains(passage.text)) {
            continue;  // keep the better (earlier) position
        }
        FusedCandidate candidate;
        candidate.passage = passage;
        candidate.denseScore = positionScore(i, denseCount);
        candidate.category = MergeCategory::DenseOnly;
        slotByText.insert(passage.text, merged.size());
        merged.push_back(std::move(candidate));
    }

    const int lexicalCount = static_cast<int>(lexicalResults.size());
    QSet<QString> lexicalSeen;
    for (int i = 0; i < lexicalCount; ++i) {
        const Passage& passage = lexicalResults[static_cast<std::size_t>(i)].passage;
        if (lexicalSeen.contains(passage.text)) {
            continue;
        }
        lexicalSeen.insert(passage.text);

        const double score = positionScore(i, lexicalCount);
        const auto slot = slotByText.constFind(passage.text);
        if (slot != slotByText.cend()) {
            FusedCandidate& existing = merged[slot.value()];
            existing.lexicalScore = score;
            existing.category = MergeCategory::Both;
            continue;
        }

        FusedCandidate candidate;
        candidate.passage = passage;
        candidate.lexicalScore = score;
        candidate.category = MergeCategory::LexicalOnly;
        slotByText.insert(passage.text, merged.size());
        merged.push_back(std::move(candidate));
    }

    for (FusedCandidate& candidate : merged) {
        candidate.fusedScore = candidate.denseScore * vectorWeight
                             + candidate.lexicalScore * lexicalWeight;
    }

    merged.erase(std::remove_if(merged.begin(), merged.end(),
                                [](const FusedCandidate& candidate) {
                                    return candidate.fusedScore <= 0.0;
                                }),
                 merged.end());

    std::stable_sort(merged.begin(), merged.end(),
                     [](const FusedCandidate& lhs, const FusedCandidate& rhs) {
                         return lhs.fusedScore > rhs.fusedScore;
                     });

    const std::size_t limit = static_cast<std::size_t>(std::max(config.maxResults, 0));
    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

} // namespace vq
