#pragma once

#include "core/cache/cache_tier.h"
#include "core/engine/collaborators.h"
#include "core/retrieval/dense_provider.h"
#include "core/shared/passage.h"
#include "core/shared/time_source.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace vq::test {

// Clock that only moves when told to.
class ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(int64_t startMs = 1'700'000'000'000LL) : m_now(startMs) {}

    int64_t nowMs() const override { return m_now.load(); }
    void advanceMs(int64_t deltaMs) { m_now.fetch_add(deltaMs); }
    void advanceSeconds(int64_t seconds) { advanceMs(seconds * 1000); }
    void setMs(int64_t nowMs) { m_now.store(nowMs); }

private:
    std::atomic<int64_t> m_now;
};

// In-memory tier whose reads and writes can be made to fail on demand.
class FailingTier : public CacheTier {
public:
    explicit FailingTier(TierKind kind = TierKind::Persistent) : m_kind(kind) {}

    TierKind kind() const override { return m_kind; }
    TierLookup get(const CacheKey& key) override;
    bool set(const CacheEntry& entry) override;

    bool failReads = false;
    bool failWrites = false;

    int reads() const { return m_reads; }
    int writes() const { return m_writes; }
    bool contains(const CacheKey& key) const;
    std::optional<CacheEntry> stored(const CacheKey& key) const;

private:
    TierKind m_kind;
    mutable std::mutex m_mutex;
    std::map<QString, CacheEntry> m_entries;
    int m_reads = 0;
    int m_writes = 0;
};

// Query history served from a fixed record list.
class StaticQueryHistory : public QueryHistory {
public:
    std::optional<QueryHistoryScan> queryHistory(const QString& videoId) override;

    void add(const QString& videoId, const QString& normalizedQuery,
             const QString& response, int64_t createdAtMs);

    bool unavailable = false;

private:
    std::vector<QueryRecord> m_records;
};

// Dense provider that returns whatever result is scripted for it.
class ScriptedDenseProvider : public DenseSimilarityProvider {
public:
    DenseSearchResult similaritySearch(const QString& videoId,
                                       const QString& query,
                                       int k) override;

    void setPassages(const std::vector<Passage>& passages);
    void setFailure(DenseSearchResult::Status status, const QString& error);

    int calls() const { return m_calls.load(); }
    int lastK() const { return m_lastK.load(); }

private:
    mutable std::mutex m_mutex;
    DenseSearchResult m_result;
    std::atomic<int> m_calls{0};
    std::atomic<int> m_lastK{0};
};

class FakeTranscriptIndexer : public TranscriptIndexer {
public:
    std::optional<std::vector<Passage>> indexVideo(const QString& videoId) override;

    std::vector<Passage> passages;
    bool fail = false;
    std::atomic<int> calls{0};
};

class FakeAnswerGenerator : public AnswerGenerator {
public:
    std::optional<QString> answer(const QString& videoId,
                                  const QString& query,
                                  const QStringList& context) override;
    std::optional<QString> summarize(const QString& videoId,
                                     const QString& content,
                                     const QString& length) override;

    bool fail = false;
    bool declineWithoutContext = false;
    std::atomic<int> answerCalls{0};
    std::atomic<int> summarizeCalls{0};

    QStringList lastContext() const;
    QString lastContent() const;

private:
    mutable std::mutex m_mutex;
    QStringList m_lastContext;
    QString m_lastContent;
};

Passage makePassage(const QString& videoId, int chunkIndex, const QString& text);
std::vector<Passage> makePassages(const QString& videoId, const QStringList& texts);

} // namespace vq::test
