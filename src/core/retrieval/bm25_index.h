#pragma once

#include "core/retrieval/ranked_candidate.h"
#include "core/shared/passage.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <vector>

namespace vq {

struct Bm25Params {
    double k1 = 1.5;
    double b = 0.75;
    double epsilon = 0.25;   // floor for negative idf, as a fraction of mean idf
};

// Bm25Index -- immutable Okapi BM25 ranking structure over one passage set.
// Built in full by the constructor and never mutated afterwards, so a
// published instance can be read from any thread without locking.
class Bm25Index {
public:
    explicit Bm25Index(std::vector<Passage> passages, Bm25Params params = {});

    // Score of every passage against the tokenized query, in insertion order.
    std::vector<double> scores(const QStringList& queryTokens) const;

    // Top k passages by descending score; ties keep insertion order.
    std::vector<RankedCandidate> topK(const QString& query, int k) const;

    int passageCount() const { return static_cast<int>(m_passages.size()); }
    const std::vector<Passage>& passages() const { return m_passages; }
    double averageLength() const { return m_avgLength; }
    double idf(const QString& term) const { return m_idf.value(term, 0.0); }

private:
    Bm25Params m_params;
    std::vector<Passage> m_passages;
    std::vector<QHash<QString, int>> m_termFreqs;
    std::vector<int> m_lengths;
    QHash<QString, double> m_idf;
    double m_avgLength = 0.0;
};

} // namespace vq
