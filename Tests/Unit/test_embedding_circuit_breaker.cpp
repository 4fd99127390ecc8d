#include <QtTest/QtTest>
#include "core/embedding/onnx_embedding_provider.h"

#include <chrono>

class TestEmbeddingCircuitBreaker : public QObject {
    Q_OBJECT

private slots:
    void testCircuitBreakerInitiallyClosed();
    void testCircuitBreakerOpensAfterThreshold();
    void testCircuitBreakerStaysClosedBelowThreshold();
    void testCircuitBreakerResetsOnSuccess();
    void testCircuitBreakerHalfOpenAfterDelay();
    void testCircuitBreakerReopensAfterFailedRetry();
    void testCircuitBreakerConstants();
    void testProviderWithoutRegistryIsUnavailable();
};

void TestEmbeddingCircuitBreaker::testCircuitBreakerInitiallyClosed()
{
    im::EmbeddingCircuitBreaker cb;
    QVERIFY(!cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), 0);
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerOpensAfterThreshold()
{
    im::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < im::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }

    QVERIFY(cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), im::EmbeddingCircuitBreaker::kOpenThreshold);
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerStaysClosedBelowThreshold()
{
    im::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < im::EmbeddingCircuitBreaker::kOpenThreshold - 1; ++i) {
        cb.recordFailure();
        QVERIFY(!cb.isOpen());
    }
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerResetsOnSuccess()
{
    im::EmbeddingCircuitBreaker cb;
    cb.recordFailure();
    cb.recordFailure();
    QCOMPARE(cb.consecutiveFailures.load(), 2);

    cb.recordSuccess();
    QCOMPARE(cb.consecutiveFailures.load(), 0);
    QVERIFY(!cb.isOpen());
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerHalfOpenAfterDelay()
{
    im::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < im::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }
    QVERIFY(cb.isOpen());

    // Push the last failure into the past instead of sleeping.
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    cb.lastFailureTime.store(now - im::EmbeddingCircuitBreaker::kHalfOpenDelayMs - 1000);
    QVERIFY(!cb.isOpen());

    cb.recordSuccess();
    QCOMPARE(cb.consecutiveFailures.load(), 0);
    QVERIFY(!cb.isOpen());
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerReopensAfterFailedRetry()
{
    im::EmbeddingCircuitBreaker cb;
    for (int i = 0; i < im::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    cb.lastFailureTime.store(now - im::EmbeddingCircuitBreaker::kHalfOpenDelayMs - 1000);
    QVERIFY(!cb.isOpen());

    cb.recordFailure();
    QVERIFY(cb.isOpen());
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerConstants()
{
    QCOMPARE(im::EmbeddingCircuitBreaker::kOpenThreshold, 5);
    QCOMPARE(im::EmbeddingCircuitBreaker::kHalfOpenDelayMs, 30000);
}

void TestEmbeddingCircuitBreaker::testProviderWithoutRegistryIsUnavailable()
{
    im::OnnxEmbeddingProvider provider(nullptr, "bi_encoder");
    QCOMPARE(provider.identity(), QStringLiteral("bi_encoder"));
    QVERIFY(!provider.initialize());
    QVERIFY(!provider.isAvailable());
    QVERIFY(provider.embed(QStringLiteral("gosto de programar")).empty());
    QVERIFY(!provider.circuitBreaker().isOpen());

    QVERIFY(im::OnnxEmbeddingProvider::createAll(nullptr).empty());
}

QTEST_MAIN(TestEmbeddingCircuitBreaker)
#include "test_embedding_circuit_breaker.moc"
