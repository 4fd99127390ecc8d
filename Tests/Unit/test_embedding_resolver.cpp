#include <QtTest/QtTest>
#include "core/embedding/embedding_resolver.h"
#include "Support/fake_embedding_provider.h"

using im::test::FakeEmbeddingProvider;

namespace {

im::EmbeddingDescriptor descriptor(const QString& identity, int dims, const QStringList& fallbacks = {})
{
    im::EmbeddingDescriptor d;
    d.identity = identity;
    d.dimensions = dims;
    d.fallbacks = fallbacks;
    return d;
}

} // namespace

class TestEmbeddingResolver : public QObject {
    Q_OBJECT

private slots:
    void testCandidateOrder();
    void testDeclaredProviderWins();
    void testFallsBackWhenDeclaredUnavailable();
    void testSkipsDimensionMismatchWithoutInitializing();
    void testExtraFallbacksBeforeRemainingProviders();
    void testNothingCompatibleReportsEveryCandidate();
    void testNoRoomForEmbeddingFails();
};

void TestEmbeddingResolver::testCandidateOrder()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("d"), 3));
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("b"), 3));

    const QStringList order = im::EmbeddingResolver::candidateOrder(
        providers, descriptor(QStringLiteral("a"), 3, {QStringLiteral("b")}),
        {QStringLiteral("c"), QStringLiteral("a")});
    QCOMPARE(order, (QStringList{QStringLiteral("a"), QStringLiteral("b"),
                                 QStringLiteral("c"), QStringLiteral("d")}));
}

void TestEmbeddingResolver::testDeclaredProviderWins()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("other"), 3));
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("declared"), 3));
    auto* declared = providers.back().get();

    im::EmbeddingProvider* resolved = im::EmbeddingResolver::resolve(
        providers, descriptor(QStringLiteral("declared"), 3), {}, 3);
    QCOMPARE(resolved, declared);
    QVERIFY(resolved->isAvailable());
}

void TestEmbeddingResolver::testFallsBackWhenDeclaredUnavailable()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("declared"), 3, false));
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("backup"), 3));
    auto* backup = providers.back().get();

    im::EmbeddingProvider* resolved = im::EmbeddingResolver::resolve(
        providers, descriptor(QStringLiteral("declared"), 3, {QStringLiteral("backup")}), {}, 3);
    QCOMPARE(resolved, backup);
}

void TestEmbeddingResolver::testSkipsDimensionMismatchWithoutInitializing()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    auto wide = std::make_unique<FakeEmbeddingProvider>(QStringLiteral("declared"), 768);
    FakeEmbeddingProvider* widePtr = wide.get();
    providers.push_back(std::move(wide));
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("small"), 3));
    auto* small = providers.back().get();

    im::EmbeddingProvider* resolved = im::EmbeddingResolver::resolve(
        providers, descriptor(QStringLiteral("declared"), 3), {}, 3);
    QCOMPARE(resolved, small);
    QCOMPARE(widePtr->initializeCalls(), 0);
}

void TestEmbeddingResolver::testExtraFallbacksBeforeRemainingProviders()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("first"), 3));
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("preferred"), 3));
    auto* preferred = providers.back().get();

    im::EmbeddingProvider* resolved = im::EmbeddingResolver::resolve(
        providers, descriptor(QStringLiteral("missing"), 3), {QStringLiteral("preferred")}, 3);
    QCOMPARE(resolved, preferred);
}

void TestEmbeddingResolver::testNothingCompatibleReportsEveryCandidate()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("wide"), 384));
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("broken"), 3, false));

    QString error;
    im::EmbeddingProvider* resolved = im::EmbeddingResolver::resolve(
        providers, descriptor(QStringLiteral("declared"), 3), {}, 3, &error);
    QVERIFY(resolved == nullptr);
    QVERIFY(error.contains(QStringLiteral("declared: not installed")));
    QVERIFY(error.contains(QStringLiteral("wide: 384 dims")));
    QVERIFY(error.contains(QStringLiteral("broken: unavailable")));
}

void TestEmbeddingResolver::testNoRoomForEmbeddingFails()
{
    std::vector<std::unique_ptr<im::EmbeddingProvider>> providers;
    providers.push_back(std::make_unique<FakeEmbeddingProvider>(QStringLiteral("declared"), 3));

    QString error;
    QVERIFY(im::EmbeddingResolver::resolve(providers, descriptor(QStringLiteral("declared"), 3),
                                           {}, 0, &error) == nullptr);
    QVERIFY(!error.isEmpty());
}

QTEST_MAIN(TestEmbeddingResolver)
#include "test_embedding_resolver.moc"
