#include "core/retrieval/bm25_index.h"
#include "core/shared/text_tokens.h"

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <numeric>
#include <utility>

namespace vq {

Bm25Index::Bm25Index(std::vector<Passage> passages, Bm25Params params)
    : m_params(params)
    , m_passages(std::move(passages))
{
    m_termFreqs.reserve(m_passages.size());
    m_lengths.reserve(m_passages.size());

    QHash<QString, int> docFreq;
    int64_t totalLength = 0;
    for (const Passage& passage : m_passages) {
        const QStringList tokens = tokenize(passage.text);
        QHash<QString, int> freqs;
        for (const QString& token : tokens) {
            ++freqs[token];
        }
        for (auto it = freqs.cbegin(); it != freqs.cend(); ++it) {
            ++docFreq[it.key()];
        }
        totalLength += tokens.size();
        m_lengths.push_back(static_cast<int>(tokens.size()));
        m_termFreqs.push_back(std::move(freqs));
    }

    if (m_passages.empty()) {
        return;
    }
    m_avgLength = static_cast<double>(totalLength) / static_cast<double>(m_passages.size());

    // Okapi idf; terms present in more than half the corpus go negative and
    // are floored to epsilon * mean idf.
    const double corpusSize = static_cast<double>(m_passages.size());
    double idfSum = 0.0;
    QStringList negativeTerms;
    for (auto it = docFreq.cbegin(); it != docFreq.cend(); ++it) {
        const double n = static_cast<double>(it.value());
        const double value = std::log(corpusSize - n + 0.5) - std::log(n + 0.5);
        m_idf.insert(it.key(), value);
        idfSum += value;
        if (value < 0.0) {
            negativeTerms.append(it.key());
        }
    }

    if (!m_idf.isEmpty()) {
        const double floor = m_params.epsilon * (idfSum / static_cast<double>(m_idf.size()));
        for (const QString& term : negativeTerms) {
            m_idf.insert(term, floor);
        }
    }
}

std::vector<double> Bm25Index::scores(const QStringList& queryTokens) const
{
    std::vector<double> result(m_passages.size(), 0.0);
    if (m_passages.empty() || m_avgLength <= 0.0) {
        return result;
    }

    const double k1 = m_params.k1;
    const double b = m_params.b;
    for (const QString& token : queryTokens) {
        const auto idfIt = m_idf.constFind(token);
        if (idfIt == m_idf.cend()) {
            continue;
        }
        for (std::size_t i = 0; i < m_passages.size(); ++i) {
            const int tf = m_termFreqs[i].value(token, 0);
            if (tf == 0) {
                continue;
            }
            const double lengthNorm = 1.0 - b + b * (static_cast<double>(m_lengths[i]) / m_avgLength);
            result[i] += idfIt.value() * (tf * (k1 + 1.0)) / (tf + k1 * lengthNorm);
        }
    }
    return result;
}

std::vector<RankedCandidate> Bm25Index::topK(const QString& query, int k) const
{
    if (k <= 0 || m_passages.empty()) {
        return {};
    }

    const std::vector<double> passageScores = scores(tokenize(query));
    std::vector<std::size_t> order(m_passages.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&passageScores](std::size_t lhs, std::size_t rhs) {
                         return passageScores[lhs] > passageScores[rhs];
                     });

    const std::size_t limit = std::min(order.size(), static_cast<std::size_t>(k));
    std::vector<RankedCandidate> top;
    top.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        RankedCandidate candidate;
        candidate.passage = m_passages[order[i]];
        candidate.sourceScore = passageScores[order[i]];
        candidate.rank = static_cast<int>(i);
        top.push_back(std::move(candidate));
    }
    return top;
}

} // namespace vq
