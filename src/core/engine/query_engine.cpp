#include "core/engine/query_engine.h"
#include "core/cache/tiered_cache.h"
#include "core/engine/collaborators.h"
#include "core/retrieval/hybrid_search.h"
#include "core/retrieval/lexical_index_builder.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <memory>
#include <utility>

namespace vq {

namespace {

// Neutral query used to pull broad transcript context for summaries.
const QString kSummaryContextQuery = QStringLiteral("full transcript");

QString summaryCacheQuery(const QString& length)
{
    return QStringLiteral("summarize %1").arg(length);
}

} // namespace

QString searchMethodToString(SearchMethod method)
{
    switch (method) {
    case SearchMethod::Hybrid:
        return QStringLiteral("hybrid");
    case SearchMethod::Vector:
        return QStringLiteral("vector");
    case SearchMethod::Keyword:
        return QStringLiteral("keyword");
    }
    return QStringLiteral("hybrid");
}

SearchMethod searchMethodFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("vector")) {
        return SearchMethod::Vector;
    }
    if (lower == QLatin1String("keyword")) {
        return SearchMethod::Keyword;
    }
    return SearchMethod::Hybrid;
}

QueryEngine::QueryEngine(TieredCacheManager& cache,
                         LexicalIndexBuilder& lexical,
                         HybridSearchEngine& search,
                         TranscriptIndexer& indexer,
                         AnswerGenerator& generator,
                         Settings settings)
    : m_cache(cache)
    , m_lexical(lexical)
    , m_search(search)
    , m_indexer(indexer)
    , m_generator(generator)
    , m_settings(std::move(settings))
{
}

QueryEngine::~QueryEngine()
{
    {
        std::lock_guard<std::mutex> lock(m_workerMutex);
        m_stopWorker = true;
    }
    m_workerCv.notify_all();
    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }
}

double QueryEngine::vectorWeightFor(SearchMethod method) const
{
    switch (method) {
    case SearchMethod::Vector:
        return 1.0;
    case SearchMethod::Keyword:
        return 0.0;
    case SearchMethod::Hybrid:
        break;
    }
    return m_settings.hybridVectorWeight;
}

bool QueryEngine::processVideo(const QString& videoId)
{
    if (m_cache.hasProcessed(videoId)) {
        LOG_DEBUG(vqCore, "Video %s already processed", qUtf8Printable(videoId));
        return true;
    }

    QElapsedTimer timer;
    timer.start();

    std::optional<std::vector<Passage>> passages = m_indexer.indexVideo(videoId);
    if (!passages) {
        LOG_ERROR(vqCore, "Transcript indexing failed for %s", qUtf8Printable(videoId));
        return false;
    }

    const int passageCount = static_cast<int>(passages->size());
    m_lexical.ensureIndex(videoId, std::move(*passages));

    if (!m_cache.markProcessed(videoId)) {
        LOG_ERROR(vqCore, "Could not persist processed marker for %s", qUtf8Printable(videoId));
        return false;
    }

    LOG_INFO(vqCore, "Processed video %s: %d passages in %lld ms",
             qUtf8Printable(videoId), passageCount, static_cast<long long>(timer.elapsed()));
    return true;
}

AnswerResult QueryEngine::answer(const QString& videoId,
                                 const QString& query,
                                 SearchMethod method)
{
    AnswerResult result;

    if (std::optional<QString> cached = m_cache.getResponse(videoId, query)) {
        result.status = AnswerResult::Status::Cached;
        result.response = std::move(*cached);
        return result;
    }

    const HybridSearchResult search = m_search.hybridSearch(
        videoId, query, m_settings.defaultTopK, vectorWeightFor(method));

    if (search.status == HybridSearchResult::Status::Failed) {
        result.status = AnswerResult::Status::Failed;
        result.error = search.error;
        return result;
    }

    const bool hasContext = search.status == HybridSearchResult::Status::Ok;
    if (!hasContext) {
        LOG_INFO(vqCore, "No transcript context for %s, answering without it",
                 qUtf8Printable(videoId));
    }

    std::optional<QString> generated = m_generator.answer(videoId, query, search.passages);
    if (!generated) {
        if (!hasContext) {
            result.status = AnswerResult::Status::NoContext;
            result.error = QStringLiteral("no context available");
            return result;
        }
        result.status = AnswerResult::Status::Failed;
        result.error = QStringLiteral("answer generation failed");
        return result;
    }

    if (!m_cache.putResponse(videoId, query, *generated)) {
        LOG_WARN(vqCore, "Answer for %s was not cached", qUtf8Printable(videoId));
    }

    result.status = AnswerResult::Status::Answered;
    result.response = std::move(*generated);
    return result;
}

std::optional<QString> QueryEngine::summarize(const QString& videoId, const QString& length)
{
    const QString cacheQuery = summaryCacheQuery(length);
    if (std::optional<QString> cached = m_cache.getResponse(videoId, cacheQuery)) {
        return cached;
    }

    const HybridSearchResult search = m_search.hybridSearch(
        videoId, kSummaryContextQuery, m_settings.summaryTopK, m_settings.hybridVectorWeight);
    if (search.status == HybridSearchResult::Status::Failed) {
        LOG_WARN(vqCore, "Summary retrieval failed for %s: %s",
                 qUtf8Printable(videoId), qUtf8Printable(search.error));
        return std::nullopt;
    }

    const QString content = search.passages.join(QStringLiteral("\n\n"));
    if (content.trimmed().isEmpty()) {
        LOG_WARN(vqCore, "Transcript is empty for %s, skipping summarization",
                 qUtf8Printable(videoId));
        return QString();
    }

    std::optional<QString> summary = m_generator.summarize(videoId, content, length);
    if (!summary) {
        LOG_WARN(vqCore, "Summary generation failed for %s", qUtf8Printable(videoId));
        return std::nullopt;
    }

    if (!m_cache.putResponse(videoId, cacheQuery, *summary)) {
        LOG_WARN(vqCore, "Summary for %s was not cached", qUtf8Printable(videoId));
    }
    return summary;
}

std::future<AnswerResult> QueryEngine::answerAsync(const QString& videoId,
                                                   const QString& query,
                                                   SearchMethod method)
{
    auto promise = std::make_shared<std::promise<AnswerResult>>();
    std::future<AnswerResult> future = promise->get_future();
    enqueue([this, promise, videoId, query, method]() {
        promise->set_value(answer(videoId, query, method));
    });
    return future;
}

std::future<bool> QueryEngine::processVideoAsync(const QString& videoId)
{
    auto promise = std::make_shared<std::promise<bool>>();
    std::future<bool> future = promise->get_future();
    enqueue([this, promise, videoId]() {
        promise->set_value(processVideo(videoId));
    });
    return future;
}

void QueryEngine::enqueue(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(m_workerMutex);
        if (!m_workerThread.joinable()) {
            m_workerThread = std::thread([this]() { workerLoop(); });
        }
        m_tasks.push_back(std::move(task));
    }
    m_workerCv.notify_one();
}

void QueryEngine::workerLoop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_workerMutex);
            m_workerCv.wait(lock, [this]() { return m_stopWorker || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
    }
}

} // namespace vq
