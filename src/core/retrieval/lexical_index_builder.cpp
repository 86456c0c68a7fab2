#include "core/retrieval/lexical_index_builder.h"
#include "core/shared/logging.h"

#include <mutex>
#include <utility>

namespace vq {

LexicalIndexBuilder::LexicalIndexBuilder(Bm25Params params)
    : m_params(params)
{
}

void LexicalIndexBuilder::ensureIndex(const QString& videoId, std::vector<Passage> passages)
{
    const int passageCount = static_cast<int>(passages.size());
    auto built = std::make_shared<const Bm25Index>(std::move(passages), m_params);

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_indexes[videoId] = std::move(built);
    }

    LOG_DEBUG(vqRetrieval, "Lexical index published for %s: %d passages",
              qUtf8Printable(videoId), passageCount);
}

std::shared_ptr<const Bm25Index> LexicalIndexBuilder::ensureIndexIfAbsent(
    const QString& videoId, std::vector<Passage> passages)
{
    auto built = std::make_shared<const Bm25Index>(std::move(passages), m_params);

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const auto result = m_indexes.try_emplace(videoId, std::move(built));
    if (!result.second) {
        LOG_DEBUG(vqRetrieval, "Lexical index for %s published concurrently, keeping it",
                  qUtf8Printable(videoId));
    }
    return result.first->second;
}

std::vector<RankedCandidate> LexicalIndexBuilder::search(
    const QString& videoId,
    const QString& query,
    int k,
    const std::vector<Passage>& availablePassages)
{
    std::shared_ptr<const Bm25Index> index = snapshot(videoId);
    if (!index) {
        if (availablePassages.empty()) {
            return {};
        }
        LOG_DEBUG(vqRetrieval, "Building lexical index lazily for %s",
                  qUtf8Printable(videoId));
        index = ensureIndexIfAbsent(videoId, availablePassages);
    }
    return index->topK(query, k);
}

std::shared_ptr<const Bm25Index> LexicalIndexBuilder::snapshot(const QString& videoId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_indexes.find(videoId);
    if (it == m_indexes.end()) {
        return nullptr;
    }
    return it->second;
}

bool LexicalIndexBuilder::hasIndex(const QString& videoId) const
{
    return snapshot(videoId) != nullptr;
}

void LexicalIndexBuilder::invalidate(const QString& videoId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_indexes.erase(videoId);
}

int LexicalIndexBuilder::namespaceCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_indexes.size());
}

} // namespace vq
