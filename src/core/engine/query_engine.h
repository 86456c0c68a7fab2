#pragma once

#include "core/shared/settings.h"

#include <QString>

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace vq {

class AnswerGenerator;
class HybridSearchEngine;
class LexicalIndexBuilder;
class TieredCacheManager;
class TranscriptIndexer;

enum class SearchMethod {
    Hybrid,
    Vector,
    Keyword,
};

QString searchMethodToString(SearchMethod method);
SearchMethod searchMethodFromString(const QString& str);

struct AnswerResult {
    enum class Status {
        Answered,
        Cached,
        NoContext,
        Failed,
    };

    Status status = Status::Failed;
    QString response;
    QString error;
};

// QueryEngine -- request flow around the cache and retrieval core:
// cache (exact, then approximate) -> hybrid search -> generator -> cache.
// All collaborators are borrowed. The async entry points queue work on one
// background worker thread, so collaborators must then be thread-safe.
// Destruction runs every queued task before joining the worker.
class QueryEngine {
public:
    QueryEngine(TieredCacheManager& cache,
                LexicalIndexBuilder& lexical,
                HybridSearchEngine& search,
                TranscriptIndexer& indexer,
                AnswerGenerator& generator,
                Settings settings);
    ~QueryEngine();

    QueryEngine(const QueryEngine&) = delete;
    QueryEngine& operator=(const QueryEngine&) = delete;

    // Index a video once. Returns true if the video is (now) processed.
    bool processVideo(const QString& videoId);

    // With no retrieved context the generator is still asked; NoContext is
    // reported only when it declines.
    AnswerResult answer(const QString& videoId,
                        const QString& query,
                        SearchMethod method = SearchMethod::Hybrid);

    // Empty string when the transcript yields no content; nullopt on failure.
    std::optional<QString> summarize(const QString& videoId,
                                     const QString& length = QStringLiteral("medium"));

    std::future<AnswerResult> answerAsync(const QString& videoId,
                                          const QString& query,
                                          SearchMethod method = SearchMethod::Hybrid);
    std::future<bool> processVideoAsync(const QString& videoId);

    double vectorWeightFor(SearchMethod method) const;
    const Settings& settings() const { return m_settings; }

private:
    void enqueue(std::function<void()> task);
    void workerLoop();

    TieredCacheManager& m_cache;
    LexicalIndexBuilder& m_lexical;
    HybridSearchEngine& m_search;
    TranscriptIndexer& m_indexer;
    AnswerGenerator& m_generator;
    Settings m_settings;

    std::mutex m_workerMutex;
    std::condition_variable m_workerCv;
    std::deque<std::function<void()>> m_tasks;
    std::thread m_workerThread;
    bool m_stopWorker = false;
};

} // namespace vq
