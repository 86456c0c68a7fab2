#include <QtTest/QtTest>
#include "core/cache/cache_key.h"
#include "core/shared/text_tokens.h"

class TestCacheKey : public QObject {
    Q_OBJECT

private slots:
    void testVideoStatusEncoding();
    void testQueryResponseEncoding();
    void testNormalizationCollapsesCaseAndWhitespace();
    void testNormalizationIsIdempotent();
    void testFingerprintIsLowercaseMd5Hex();
    void testDifferentVideosProduceDifferentKeys();
    void testKindNames();
    void testTokenizeKeepsDuplicates();
};

void TestCacheKey::testVideoStatusEncoding()
{
    const vq::CacheKey key = vq::CacheKey::videoStatus(QStringLiteral("abc123"));
    QCOMPARE(key.kind(), vq::CacheKind::VideoStatus);
    QCOMPARE(key.videoId(), QStringLiteral("abc123"));
    QCOMPARE(key.encoded(), QStringLiteral("video_processed:abc123"));
    QVERIFY(key.fingerprint().isEmpty());
}

void TestCacheKey::testQueryResponseEncoding()
{
    const vq::CacheKey key = vq::CacheKey::queryResponse(QStringLiteral("abc123"),
                                                         QStringLiteral("What is it?"));
    QCOMPARE(key.kind(), vq::CacheKind::QueryResponse);
    QCOMPARE(key.normalizedQuery(), QStringLiteral("what is it?"));
    QCOMPARE(key.encoded(),
             QStringLiteral("query:abc123:") + vq::CacheKey::fingerprintOf(QStringLiteral("what is it?")));
}

void TestCacheKey::testNormalizationCollapsesCaseAndWhitespace()
{
    const vq::CacheKey a = vq::CacheKey::queryResponse(QStringLiteral("v"),
                                                       QStringLiteral("What IS the  Topic"));
    const vq::CacheKey b = vq::CacheKey::queryResponse(QStringLiteral("v"),
                                                       QStringLiteral("  what is\tthe topic\n"));
    QCOMPARE(a.normalizedQuery(), QStringLiteral("what is the topic"));
    QCOMPARE(a, b);
    QCOMPARE(a.fingerprint(), b.fingerprint());
}

void TestCacheKey::testNormalizationIsIdempotent()
{
    const QStringList samples = {
        QStringLiteral("  Mixed   CASE\tquery "),
        QStringLiteral("already normalized"),
        QString(),
        QStringLiteral("\n\n"),
    };
    for (const QString& raw : samples) {
        const QString once = vq::normalizeText(raw);
        QCOMPARE(vq::normalizeText(once), once);
    }
}

void TestCacheKey::testFingerprintIsLowercaseMd5Hex()
{
    // md5("") and md5("abc")
    QCOMPARE(vq::CacheKey::fingerprintOf(QString()),
             QStringLiteral("d41d8cd98f00b204e9800998ecf8427e"));
    QCOMPARE(vq::CacheKey::fingerprintOf(QStringLiteral("abc")),
             QStringLiteral("900150983cd24fb0d6963f7d28e17f72"));
}

void TestCacheKey::testDifferentVideosProduceDifferentKeys()
{
    const vq::CacheKey a = vq::CacheKey::queryResponse(QStringLiteral("v1"), QStringLiteral("q"));
    const vq::CacheKey b = vq::CacheKey::queryResponse(QStringLiteral("v2"), QStringLiteral("q"));
    QVERIFY(a != b);
    QCOMPARE(a.fingerprint(), b.fingerprint());
    QVERIFY(vq::CacheKey::videoStatus(QStringLiteral("v1")) != a);
}

void TestCacheKey::testKindNames()
{
    QCOMPARE(vq::cacheKindToString(vq::CacheKind::VideoStatus), QStringLiteral("video-status"));
    QCOMPARE(vq::cacheKindToString(vq::CacheKind::QueryResponse), QStringLiteral("query-response"));
}

void TestCacheKey::testTokenizeKeepsDuplicates()
{
    const QStringList tokens = vq::tokenize(QStringLiteral("The  cat and THE hat"));
    QCOMPARE(tokens, (QStringList{QStringLiteral("the"), QStringLiteral("cat"),
                                  QStringLiteral("and"), QStringLiteral("the"),
                                  QStringLiteral("hat")}));
    QVERIFY(vq::tokenize(QStringLiteral("   ")).isEmpty());
}

QTEST_MAIN(TestCacheKey)
#include "test_cache_key.moc"
