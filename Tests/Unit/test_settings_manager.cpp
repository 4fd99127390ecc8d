#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testEmptyJsonKeepsDefaults();
    void testJsonRoundTrip();
    void testPartialOverride();
    void testNegativeTimeoutClamped();
    void testNonNumericKeysSkipped();
    void testSaveLoad();
    void testMissingFileReturnsNullopt();
    void testMalformedFileReturnsNullopt();
    void testSettingsFilePath();
};

void TestSettingsManager::testDefaults()
{
    const im::EngineSettings settings;
    QCOMPARE(settings.questionnaire.questionWeights.at(1), 0.15);
    QCOMPARE(settings.questionnaire.questionWeights.at(5), 0.4);
    QCOMPARE(settings.questionnaire.consistencyBonus.at(5), 1.6);
    QCOMPARE(settings.questionnaire.hobbyQuestionId, 1);
    QCOMPARE(settings.combination.baseWeights.questionnaire, 0.6);
    QCOMPARE(settings.combination.baseWeights.text, 0.4);
    QCOMPARE(settings.combination.agreementThreshold, 0.5);
    QCOMPARE(settings.combination.agreementBonus, 1.2);
    QCOMPARE(settings.minTextChars, 10);
    QCOMPARE(settings.embeddingFallbacks.size(), qsizetype(3));
    QCOMPARE(settings.embeddingCacheEntries, 256);
    QCOMPARE(settings.inferenceTimeoutMs, 5000);
}

void TestSettingsManager::testEmptyJsonKeepsDefaults()
{
    const im::EngineSettings parsed = im::SettingsManager::fromJson(QJsonObject());
    const im::EngineSettings defaults;
    QVERIFY(parsed.questionnaire.questionWeights == defaults.questionnaire.questionWeights);
    QVERIFY(parsed.questionnaire.consistencyBonus == defaults.questionnaire.consistencyBonus);
    QVERIFY(parsed.questionnaire.hobbyPenalties == defaults.questionnaire.hobbyPenalties);
    QCOMPARE(parsed.textQuality.longWordLimit, defaults.textQuality.longWordLimit);
    QCOMPARE(parsed.embeddingFallbacks, defaults.embeddingFallbacks);
    QCOMPARE(parsed.embeddingCacheTtlSeconds, defaults.embeddingCacheTtlSeconds);
    QCOMPARE(parsed.inferenceTimeoutMs, defaults.inferenceTimeoutMs);
}

void TestSettingsManager::testJsonRoundTrip()
{
    im::EngineSettings settings;
    settings.questionnaire.questionWeights = {{1, 0.5}, {7, 0.25}};
    settings.questionnaire.hobbyQuestionId = 7;
    settings.questionnaire.hobbyPenalties = {{QStringLiteral("Tech"), 0.9}};
    settings.combination.baseWeights.questionnaire = 0.7;
    settings.combination.baseWeights.text = 0.3;
    settings.combination.agreementBonus = 1.5;
    settings.textQuality.keywordDensityScale = 4.0;
    settings.minTextChars = 25;
    settings.embeddingFallbacks = {QStringLiteral("local/embedder")};
    settings.embeddingCacheEntries = 0;
    settings.inferenceTimeoutMs = 0;

    const im::EngineSettings restored =
        im::SettingsManager::fromJson(im::SettingsManager::toJson(settings));
    QVERIFY(restored.questionnaire.questionWeights == settings.questionnaire.questionWeights);
    QCOMPARE(restored.questionnaire.hobbyQuestionId, 7);
    QVERIFY(restored.questionnaire.hobbyPenalties == settings.questionnaire.hobbyPenalties);
    QCOMPARE(restored.combination.baseWeights.questionnaire, 0.7);
    QCOMPARE(restored.combination.baseWeights.text, 0.3);
    QCOMPARE(restored.combination.agreementBonus, 1.5);
    QCOMPARE(restored.textQuality.keywordDensityScale, 4.0);
    QCOMPARE(restored.minTextChars, 25);
    QCOMPARE(restored.embeddingFallbacks, QStringList{QStringLiteral("local/embedder")});
    QCOMPARE(restored.embeddingCacheEntries, 0);
    QCOMPARE(restored.inferenceTimeoutMs, 0);
}

void TestSettingsManager::testPartialOverride()
{
    QJsonObject combination;
    combination.insert(QStringLiteral("agreementThreshold"), 0.4);
    QJsonObject json;
    json.insert(QStringLiteral("combination"), combination);
    json.insert(QStringLiteral("minTextChars"), 3);

    const im::EngineSettings parsed = im::SettingsManager::fromJson(json);
    QCOMPARE(parsed.combination.agreementThreshold, 0.4);
    QCOMPARE(parsed.combination.agreementBonus, 1.2);
    QCOMPARE(parsed.combination.baseWeights.questionnaire, 0.6);
    QCOMPARE(parsed.minTextChars, 3);
    QCOMPARE(parsed.questionnaire.questionWeights.size(), size_t(5));
}

void TestSettingsManager::testNegativeTimeoutClamped()
{
    QJsonObject json;
    json.insert(QStringLiteral("inferenceTimeoutMs"), -200);
    QCOMPARE(im::SettingsManager::fromJson(json).inferenceTimeoutMs, 0);
}

void TestSettingsManager::testNonNumericKeysSkipped()
{
    QJsonObject weights;
    weights.insert(QStringLiteral("2"), 0.9);
    weights.insert(QStringLiteral("two"), 0.1);
    QJsonObject json;
    json.insert(QStringLiteral("questionWeights"), weights);

    const im::EngineSettings parsed = im::SettingsManager::fromJson(json);
    QCOMPARE(parsed.questionnaire.questionWeights.size(), size_t(1));
    QCOMPARE(parsed.questionnaire.questionWeights.at(2), 0.9);
}

void TestSettingsManager::testSaveLoad()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = QDir(tempDir.path()).filePath(QStringLiteral("nested/dir/settings.json"));

    im::EngineSettings settings;
    settings.combination.agreementThreshold = 0.65;
    settings.embeddingCacheTtlSeconds = 60;
    QVERIFY(im::SettingsManager::save(settings, path));
    QVERIFY(QFile::exists(path));

    const auto loaded = im::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->combination.agreementThreshold, 0.65);
    QCOMPARE(loaded->embeddingCacheTtlSeconds, 60);
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(!im::SettingsManager::load(
                 QDir(tempDir.path()).filePath(QStringLiteral("absent.json")))
                 .has_value());
}

void TestSettingsManager::testMalformedFileReturnsNullopt()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = QDir(tempDir.path()).filePath(QStringLiteral("settings.json"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QVERIFY(file.write("{ not json") > 0);
    file.close();
    QVERIFY(!im::SettingsManager::load(path).has_value());

    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QVERIFY(file.write("[1, 2, 3]") > 0);
    file.close();
    QVERIFY(!im::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testSettingsFilePath()
{
    QVERIFY(im::SettingsManager::settingsFilePath().endsWith(
        QStringLiteral("/interestmapper/settings.json")));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
