#include <QtTest/QtTest>
#include "core/text/text_quality_estimator.h"

namespace {

im::KeywordTable sampleKeywords()
{
    im::KeywordTable keywords;
    keywords[QStringLiteral("arte")][QStringLiteral("Artes")] = 1.5;
    keywords[QStringLiteral("pintar")][QStringLiteral("Artes")] = 1.0;
    keywords[QStringLiteral("programar")][QStringLiteral("Tecnologia")] = 2.0;
    return keywords;
}

} // namespace

class TestTextQualityEstimator : public QObject {
    Q_OBJECT

private slots:
    void testLengthFactorBoundaries();
    void testEmptyTextScoresZero();
    void testProcessedTextWithKeywords();
    void testWithoutKeywordTable();
    void testPunctuationCounts();
    void testRepetitionLowersDiversity();
    void testIdealLengthWithPunctuation();
    void testCustomConfig();
};

void TestTextQualityEstimator::testLengthFactorBoundaries()
{
    im::TextQualityEstimator estimator(nullptr);
    QCOMPARE(estimator.lengthFactor(1), 0.3);
    QCOMPARE(estimator.lengthFactor(9), 0.3);
    QCOMPARE(estimator.lengthFactor(10), 0.6);
    QCOMPARE(estimator.lengthFactor(19), 0.6);
    QCOMPARE(estimator.lengthFactor(20), 1.0);
    QCOMPARE(estimator.lengthFactor(200), 1.0);
    QCOMPARE(estimator.lengthFactor(201), 0.8);
}

void TestTextQualityEstimator::testEmptyTextScoresZero()
{
    const im::KeywordTable keywords = sampleKeywords();
    im::TextQualityEstimator estimator(&keywords);
    QCOMPARE(estimator.estimate(QString()), 0.0);
    QCOMPARE(estimator.estimate(QStringLiteral("   ")), 0.0);
}

void TestTextQualityEstimator::testProcessedTextWithKeywords()
{
    const im::KeywordTable keywords = sampleKeywords();
    im::TextQualityEstimator estimator(&keywords);

    // 9 words (0.3), all distinct (1.0), 3 keyword words (capped 1.0), no punctuation (0.7).
    const double quality = estimator.estimate(
        QStringLiteral("eu gosto de programar e pintar arte todo dia"));
    QCOMPARE(quality, 0.75);
}

void TestTextQualityEstimator::testWithoutKeywordTable()
{
    im::TextQualityEstimator estimator(nullptr);
    const double quality = estimator.estimate(
        QStringLiteral("eu gosto de programar e pintar arte todo dia"));
    QCOMPARE(quality, 0.5);
}

void TestTextQualityEstimator::testPunctuationCounts()
{
    im::TextQualityEstimator estimator(nullptr);
    QCOMPARE(estimator.estimate(QStringLiteral("Eu gosto de arte.")), (0.3 + 1.0 + 0.0 + 1.0) / 4.0);
    QCOMPARE(estimator.estimate(QStringLiteral("Eu gosto de arte")), (0.3 + 1.0 + 0.0 + 0.7) / 4.0);
}

void TestTextQualityEstimator::testRepetitionLowersDiversity()
{
    im::TextQualityEstimator estimator(nullptr);
    QCOMPARE(estimator.estimate(QStringLiteral("arte arte arte arte")), (0.3 + 0.5 + 0.0 + 0.7) / 4.0);
}

void TestTextQualityEstimator::testIdealLengthWithPunctuation()
{
    const im::KeywordTable keywords = sampleKeywords();
    im::TextQualityEstimator estimator(&keywords);

    QStringList words;
    for (int i = 0; i < 20; ++i) {
        words << QStringLiteral("palavra%1").arg(i);
    }
    words << QStringLiteral("arte,");
    words << QStringLiteral("pintar");
    const double quality = estimator.estimate(words.join(QLatin1Char(' ')));

    // 22 words, only "pintar" counts as a keyword ("arte," keeps its comma).
    const double density = std::min(1.0 / 22.0 * 10.0, 1.0);
    QCOMPARE(quality, (1.0 + 1.0 + density + 1.0) / 4.0);
    QVERIFY(quality >= 0.0 && quality <= 1.0);
}

void TestTextQualityEstimator::testCustomConfig()
{
    im::TextQualityConfig config;
    config.missingPunctuationScore = 0.0;
    config.shortScore = 0.0;
    im::TextQualityEstimator estimator(nullptr, config);
    QCOMPARE(estimator.estimate(QStringLiteral("uma frase curta")), 0.25);
}

QTEST_MAIN(TestTextQualityEstimator)
#include "test_text_quality_estimator.moc"
