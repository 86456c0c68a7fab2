#include <QtTest/QtTest>
#include "core/cache/tiered_cache.h"
#include "core/engine/query_engine.h"
#include "core/retrieval/hybrid_search.h"
#include "core/retrieval/lexical_index_builder.h"
#include "core/shared/settings_manager.h"
#include "test_fakes.h"

#include <future>

namespace {

// One engine wired to fakes; durable tier is an in-memory FailingTier.
struct Harness {
    explicit Harness(vq::DenseFailurePolicy policy = vq::DenseFailurePolicy::DegradeToLexical)
        : cache({&fast, &durable}, clock)
        , search(&dense, lexical, policy)
        , engine(cache, lexical, search, indexer, generator, vq::SettingsManager::defaults())
    {
        indexer.passages = vq::test::makePassages(QStringLiteral("vid"), {
            QStringLiteral("the speaker introduces the new camera lineup"),
            QStringLiteral("battery life is rated at ten hours"),
            QStringLiteral("pricing starts at four hundred dollars"),
        });
        dense.setPassages(indexer.passages);
    }

    vq::test::ManualTimeSource clock;
    vq::test::FailingTier fast{vq::TierKind::Memory};
    vq::test::FailingTier durable{vq::TierKind::File};
    vq::TieredCacheManager cache;
    vq::LexicalIndexBuilder lexical;
    vq::test::ScriptedDenseProvider dense;
    vq::HybridSearchEngine search;
    vq::test::FakeTranscriptIndexer indexer;
    vq::test::FakeAnswerGenerator generator;
    vq::QueryEngine engine;
};

} // namespace

class TestQueryEngine : public QObject {
    Q_OBJECT

private slots:
    void testProcessVideoIndexesOnce()
    {
        Harness h;
        QVERIFY(h.engine.processVideo(QStringLiteral("vid")));
        QVERIFY(h.cache.hasProcessed(QStringLiteral("vid")));
        QVERIFY(h.lexical.hasIndex(QStringLiteral("vid")));

        QVERIFY(h.engine.processVideo(QStringLiteral("vid")));
        QCOMPARE(h.indexer.calls.load(), 1);
    }

    void testProcessVideoFailureIsNotMarked()
    {
        Harness h;
        h.indexer.fail = true;
        QVERIFY(!h.engine.processVideo(QStringLiteral("vid")));
        QVERIFY(!h.cache.hasProcessed(QStringLiteral("vid")));
    }

    void testAnswerThenCached()
    {
        Harness h;
        QVERIFY(h.engine.processVideo(QStringLiteral("vid")));

        const vq::AnswerResult first = h.engine.answer(QStringLiteral("vid"),
                                                       QStringLiteral("How long does the battery last?"));
        QCOMPARE(first.status, vq::AnswerResult::Status::Answered);
        QVERIFY(!first.response.isEmpty());
        QCOMPARE(h.generator.answerCalls.load(), 1);
        QVERIFY(!h.generator.lastContext().isEmpty());
        QVERIFY(h.generator.lastContext().size() <= h.engine.settings().defaultTopK);

        const vq::AnswerResult second = h.engine.answer(QStringLiteral("vid"),
                                                        QStringLiteral("  how long does the BATTERY last? "));
        QCOMPARE(second.status, vq::AnswerResult::Status::Cached);
        QCOMPARE(second.response, first.response);
        QCOMPARE(h.generator.answerCalls.load(), 1);
    }

    void testNoContextStillAsksGenerator()
    {
        Harness h;
        h.dense.setPassages({});

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("empty"), QStringLiteral("anything"));
        QCOMPARE(result.status, vq::AnswerResult::Status::Answered);
        QCOMPARE(h.generator.answerCalls.load(), 1);
        QVERIFY(h.generator.lastContext().isEmpty());
        QCOMPARE(h.cache.getResponse(QStringLiteral("empty"), QStringLiteral("anything")).value_or(QString()),
                 result.response);
    }

    void testNoContextWhenGeneratorDeclines()
    {
        Harness h;
        h.dense.setPassages({});
        h.generator.declineWithoutContext = true;

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("empty"), QStringLiteral("anything"));
        QCOMPARE(result.status, vq::AnswerResult::Status::NoContext);
        QCOMPARE(h.generator.answerCalls.load(), 1);
        QVERIFY(!h.cache.getResponse(QStringLiteral("empty"), QStringLiteral("anything")).has_value());
    }

    void testDenseFailureUnderStrictPolicyFails()
    {
        Harness h(vq::DenseFailurePolicy::Fail);
        h.dense.setFailure(vq::DenseSearchResult::Status::Unavailable, QStringLiteral("offline"));

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("vid"), QStringLiteral("pricing"));
        QCOMPARE(result.status, vq::AnswerResult::Status::Failed);
        QVERIFY(result.error.contains(QStringLiteral("offline")));
        QCOMPARE(h.generator.answerCalls.load(), 0);
    }

    void testDenseFailureDegradesWhenIndexed()
    {
        Harness h;
        QVERIFY(h.engine.processVideo(QStringLiteral("vid")));
        h.dense.setFailure(vq::DenseSearchResult::Status::TimedOut, QStringLiteral("slow"));

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("vid"), QStringLiteral("pricing"));
        QCOMPARE(result.status, vq::AnswerResult::Status::Answered);
        QCOMPARE(h.generator.lastContext().first(),
                 QStringLiteral("pricing starts at four hundred dollars"));
    }

    void testGeneratorFailureIsNotCached()
    {
        Harness h;
        h.generator.fail = true;

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("vid"), QStringLiteral("pricing"));
        QCOMPARE(result.status, vq::AnswerResult::Status::Failed);
        QVERIFY(!h.cache.getResponse(QStringLiteral("vid"), QStringLiteral("pricing")).has_value());
    }

    void testDurableWriteFailureStillAnswers()
    {
        Harness h;
        h.durable.failWrites = true;

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("vid"), QStringLiteral("pricing"));
        QCOMPARE(result.status, vq::AnswerResult::Status::Answered);
        QCOMPARE(h.cache.stats().durableWriteFailures, uint64_t(1));
    }

    void testSummarizeCachesByLength()
    {
        Harness h;
        const std::optional<QString> summary = h.engine.summarize(QStringLiteral("vid"));
        QVERIFY(summary.has_value());
        QVERIFY(!summary->isEmpty());
        QCOMPARE(h.dense.lastK(), h.engine.settings().summaryTopK);
        QVERIFY(h.generator.lastContent().contains(QStringLiteral("\n\n")));

        QCOMPARE(h.cache.getResponse(QStringLiteral("vid"), QStringLiteral("summarize medium"))
                     .value_or(QString()),
                 *summary);

        QCOMPARE(h.engine.summarize(QStringLiteral("vid")).value_or(QString()), *summary);
        QCOMPARE(h.generator.summarizeCalls.load(), 1);

        QVERIFY(h.engine.summarize(QStringLiteral("vid"), QStringLiteral("short")).has_value());
        QCOMPARE(h.generator.summarizeCalls.load(), 2);
    }

    void testSummaryIsSharedWithMatchingQuestion()
    {
        Harness h;
        const std::optional<QString> summary = h.engine.summarize(QStringLiteral("vid"));
        QVERIFY(summary.has_value());

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("vid"),
                                                        QStringLiteral("Summarize  MEDIUM"));
        QCOMPARE(result.status, vq::AnswerResult::Status::Cached);
        QCOMPARE(result.response, *summary);
        QCOMPARE(h.generator.answerCalls.load(), 0);
    }

    void testSummarizeEmptyTranscript()
    {
        Harness h;
        h.dense.setPassages({});

        const std::optional<QString> summary = h.engine.summarize(QStringLiteral("empty"));
        QVERIFY(summary.has_value());
        QVERIFY(summary->isEmpty());
        QCOMPARE(h.generator.summarizeCalls.load(), 0);
        QVERIFY(!h.cache.getResponse(QStringLiteral("empty"), QStringLiteral("summarize medium")).has_value());
    }

    void testSummarizeGeneratorFailure()
    {
        Harness h;
        h.generator.fail = true;
        QVERIFY(!h.engine.summarize(QStringLiteral("vid")).has_value());
    }

    void testSearchMethodWeights()
    {
        Harness h;
        QCOMPARE(h.engine.vectorWeightFor(vq::SearchMethod::Vector), 1.0);
        QCOMPARE(h.engine.vectorWeightFor(vq::SearchMethod::Keyword), 0.0);
        QCOMPARE(h.engine.vectorWeightFor(vq::SearchMethod::Hybrid), 0.7);

        QCOMPARE(vq::searchMethodFromString(QStringLiteral("Keyword")), vq::SearchMethod::Keyword);
        QCOMPARE(vq::searchMethodFromString(QStringLiteral("vector")), vq::SearchMethod::Vector);
        QCOMPARE(vq::searchMethodFromString(QStringLiteral("other")), vq::SearchMethod::Hybrid);
        QCOMPARE(vq::searchMethodToString(vq::SearchMethod::Keyword), QStringLiteral("keyword"));
    }

    void testKeywordMethodUsesLexicalOrder()
    {
        Harness h;
        QVERIFY(h.engine.processVideo(QStringLiteral("vid")));

        const vq::AnswerResult result = h.engine.answer(QStringLiteral("vid"), QStringLiteral("battery"),
                                                        vq::SearchMethod::Keyword);
        QCOMPARE(result.status, vq::AnswerResult::Status::Answered);
        QCOMPARE(h.generator.lastContext().first(), QStringLiteral("battery life is rated at ten hours"));
    }

    void testAsyncEntryPoints()
    {
        Harness h;
        std::future<bool> processed = h.engine.processVideoAsync(QStringLiteral("vid"));
        QVERIFY(processed.get());

        std::future<vq::AnswerResult> future = h.engine.answerAsync(QStringLiteral("vid"),
                                                                    QStringLiteral("pricing"));
        QCOMPARE(future.get().status, vq::AnswerResult::Status::Answered);
    }

    void testAsyncTasksRunInSubmissionOrder()
    {
        Harness h;
        std::future<bool> processed = h.engine.processVideoAsync(QStringLiteral("vid"));
        std::future<vq::AnswerResult> answered = h.engine.answerAsync(QStringLiteral("vid"),
                                                                      QStringLiteral("battery"),
                                                                      vq::SearchMethod::Keyword);
        QVERIFY(processed.get());
        QCOMPARE(answered.get().status, vq::AnswerResult::Status::Answered);
        QCOMPARE(h.generator.lastContext().first(), QStringLiteral("battery life is rated at ten hours"));
        QCOMPARE(h.indexer.calls.load(), 1);
    }

    void testPendingAsyncWorkFinishesOnShutdown()
    {
        std::future<bool> processed;
        {
            Harness h;
            processed = h.engine.processVideoAsync(QStringLiteral("vid"));
        }
        QVERIFY(processed.get());
    }
};

QTEST_MAIN(TestQueryEngine)
#include "test_query_engine.moc"
