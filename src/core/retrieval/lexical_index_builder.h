#pragma once

#include "core/retrieval/bm25_index.h"
#include "core/retrieval/ranked_candidate.h"
#include "core/shared/passage.h"

#include <QString>

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace vq {

// LexicalIndexBuilder -- owns one BM25 snapshot per video namespace.
//
// A rebuild constructs a complete new Bm25Index outside the lock and then
// publishes it by swapping the namespace's pointer under an exclusive lock.
// Readers take a shared lock only long enough to copy the pointer, so an
// in-flight search always scores against a complete index (old or new).
class LexicalIndexBuilder {
public:
    explicit LexicalIndexBuilder(Bm25Params params = {});

    // Build (or rebuild wholesale) the namespace's index, replacing any
    // previous one.
    void ensureIndex(const QString& videoId, std::vector<Passage> passages);

    // Publish an index built from `passages` only if the namespace has none.
    // Returns whichever index is published afterwards.
    std::shared_ptr<const Bm25Index> ensureIndexIfAbsent(const QString& videoId,
                                                         std::vector<Passage> passages);

    // Top k passages for the query. Without an index, builds one lazily from
    // `availablePassages`; with neither, returns an empty list.
    std::vector<RankedCandidate> search(const QString& videoId,
                                        const QString& query,
                                        int k,
                                        const std::vector<Passage>& availablePassages = {});

    std::shared_ptr<const Bm25Index> snapshot(const QString& videoId) const;
    bool hasIndex(const QString& videoId) const;
    void invalidate(const QString& videoId);
    int namespaceCount() const;

private:
    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };

    Bm25Params m_params;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<QString, std::shared_ptr<const Bm25Index>, QStringHash> m_indexes;
};

} // namespace vq
