#include <QtTest/QtTest>
#include "core/retrieval/dense_provider.h"
#include "core/retrieval/hybrid_search.h"
#include "core/retrieval/lexical_index_builder.h"
#include "test_fakes.h"

namespace {

QStringList transcript()
{
    return {
        QStringLiteral("welcome to the quarterly earnings call"),
        QStringLiteral("revenue grew twelve percent year over year"),
        QStringLiteral("operating margin improved on lower shipping costs"),
        QStringLiteral("we expect revenue growth to continue next quarter"),
        QStringLiteral("questions from analysts followed the prepared remarks"),
    };
}

} // namespace

class TestHybridSearch : public QObject {
    Q_OBJECT

private slots:
    void testEmptyNamespaceReturnsNoContext()
    {
        vq::test::ScriptedDenseProvider dense;
        dense.setPassages({});
        vq::LexicalIndexBuilder lexical;
        vq::HybridSearchEngine engine(&dense, lexical);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("empty"), QStringLiteral("anything"), 4, 0.7);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::NoContext);
        QVERIFY(result.passages.isEmpty());
        QVERIFY(!result.denseDegraded);
        QVERIFY(result.error.isEmpty());
    }

    void testFusesBothSignals()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::test::ScriptedDenseProvider dense;
        dense.setPassages({passages[0], passages[1], passages[2]});
        vq::LexicalIndexBuilder lexical;
        lexical.ensureIndex(QStringLiteral("vid"), passages);
        vq::HybridSearchEngine engine(&dense, lexical);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("revenue growth"), 3, 0.7);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::Ok);
        QVERIFY(result.hasContext());
        // Lexical ranks [3, 1, 0]; the lexical-only hit outranks the weakest
        // dense-only passage.
        QCOMPARE(result.passages,
                 (QStringList{passages[0].text, passages[1].text, passages[3].text}));
        QCOMPARE(dense.lastK(), 3);
    }

    void testVectorOnlyWeightIgnoresLexical()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::test::ScriptedDenseProvider dense;
        dense.setPassages({passages[4], passages[0]});
        vq::LexicalIndexBuilder lexical;
        lexical.ensureIndex(QStringLiteral("vid"), passages);
        vq::HybridSearchEngine engine(&dense, lexical);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("revenue"), 4, 1.0);
        QCOMPARE(result.passages, (QStringList{passages[4].text, passages[0].text}));
    }

    void testLexicalIndexBuiltLazilyFromDenseHits()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::test::ScriptedDenseProvider dense;
        dense.setPassages({passages[0], passages[3]});
        vq::LexicalIndexBuilder lexical;
        vq::HybridSearchEngine engine(&dense, lexical);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("revenue"), 2, 0.7);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::Ok);
        QVERIFY(lexical.hasIndex(QStringLiteral("vid")));
        QCOMPARE(lexical.snapshot(QStringLiteral("vid"))->passageCount(), 2);
    }

    void testDenseFailureDegradesToLexical()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::test::ScriptedDenseProvider dense;
        dense.setFailure(vq::DenseSearchResult::Status::TimedOut, QStringLiteral("deadline exceeded"));
        vq::LexicalIndexBuilder lexical;
        lexical.ensureIndex(QStringLiteral("vid"), passages);
        vq::HybridSearchEngine engine(&dense, lexical, vq::DenseFailurePolicy::DegradeToLexical);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("operating margin"), 2, 0.7);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::Ok);
        QVERIFY(result.denseDegraded);
        QVERIFY(result.error.contains(QStringLiteral("timed out")));
        QCOMPARE(result.passages.first(), passages[2].text);
    }

    void testDenseFailureFailsUnderStrictPolicy()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::test::ScriptedDenseProvider dense;
        dense.setFailure(vq::DenseSearchResult::Status::Unavailable, QStringLiteral("connection refused"));
        vq::LexicalIndexBuilder lexical;
        lexical.ensureIndex(QStringLiteral("vid"), passages);
        vq::HybridSearchEngine engine(&dense, lexical, vq::DenseFailurePolicy::Fail);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("operating margin"), 2, 0.7);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::Failed);
        QVERIFY(result.passages.isEmpty());
        QVERIFY(result.error.contains(QStringLiteral("connection refused")));
    }

    void testNoProviderIsLexicalOnly()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::LexicalIndexBuilder lexical;
        lexical.ensureIndex(QStringLiteral("vid"), passages);
        vq::HybridSearchEngine engine(nullptr, lexical);

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("analysts"), 1, 0.7);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::Ok);
        QVERIFY(result.denseDegraded);
        QCOMPARE(result.passages, QStringList{passages[4].text});
    }

    void testNonPositiveKReturnsNothing()
    {
        vq::test::ScriptedDenseProvider dense;
        vq::LexicalIndexBuilder lexical;
        vq::HybridSearchEngine engine(&dense, lexical);

        QCOMPARE(engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("q"), 0, 0.7).status,
                 vq::HybridSearchResult::Status::NoContext);
        QCOMPARE(dense.calls(), 0);
    }

    void testCircuitOpensAfterRepeatedFailures()
    {
        const auto passages = vq::test::makePassages(QStringLiteral("vid"), transcript());
        vq::test::ScriptedDenseProvider dense;
        dense.setFailure(vq::DenseSearchResult::Status::Unavailable, QStringLiteral("down"));
        vq::LexicalIndexBuilder lexical;
        lexical.ensureIndex(QStringLiteral("vid"), passages);
        vq::HybridSearchEngine engine(&dense, lexical);

        for (int i = 0; i < vq::DenseCircuitBreaker::kOpenThreshold; ++i) {
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("revenue"), 2, 0.7);
        }
        QCOMPARE(dense.calls(), vq::DenseCircuitBreaker::kOpenThreshold);
        QVERIFY(engine.circuitBreaker().isOpen());

        const vq::HybridSearchResult result =
            engine.hybridSearch(QStringLiteral("vid"), QStringLiteral("revenue"), 2, 0.7);
        QCOMPARE(dense.calls(), vq::DenseCircuitBreaker::kOpenThreshold);
        QVERIFY(result.denseDegraded);
        QCOMPARE(result.status, vq::HybridSearchResult::Status::Ok);
    }

    void testCircuitClosesOnSuccess()
    {
        vq::DenseCircuitBreaker breaker;
        for (int i = 0; i < vq::DenseCircuitBreaker::kOpenThreshold; ++i) {
            breaker.recordFailure();
        }
        QVERIFY(breaker.isOpen());
        breaker.recordSuccess();
        QVERIFY(!breaker.isOpen());
    }
};

QTEST_MAIN(TestHybridSearch)
#include "test_hybrid_search.moc"
