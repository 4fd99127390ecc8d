#include <QtTest/QtTest>
#include "core/models/artifact_manifest.h"
#include "core/models/file_model_artifact.h"
#include "Support/fixture_paths.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>

#include <cmath>

namespace {

im::ArtifactManifest makeManifest(const QStringList& labels, int width)
{
    im::ArtifactManifest manifest;
    manifest.artifactId = QStringLiteral("inline");
    manifest.labels = labels;
    manifest.scalerMean.assign(static_cast<size_t>(width), 0.0);
    manifest.scalerScale.assign(static_cast<size_t>(width), 1.0);
    manifest.classifier.type = QStringLiteral("linear_softmax");
    manifest.classifier.coefficients.assign(static_cast<size_t>(labels.size()),
                                            std::vector<double>(static_cast<size_t>(width), 0.0));
    manifest.classifier.intercepts.assign(static_cast<size_t>(labels.size()), 0.0);
    return manifest;
}

} // namespace

class TestFileModelArtifact : public QObject {
    Q_OBJECT

private slots:
    void testLoadFixture();
    void testFixturePrediction();
    void testMissingDirectoryFails();
    void testMalformedJsonFails();
    void testUnsupportedClassifierTypeFails();
    void testMissingClassifierSectionFails();
    void testEmptyLabelsFail();
    void testScalerLengthMismatchFails();
    void testClassifierWidthMismatchFails();
    void testClassCountMismatchFails();
    void testOnnxClassifierWithoutRegistryFails();
    void testAreaOrderDefaultsToVocabularyKeys();
    void testAreaOrderDefaultsToSortedLabels();
};

void TestFileModelArtifact::testLoadFixture()
{
    QString error;
    auto artifact = im::FileModelArtifact::load(im::test::artifactFixtureDir(), nullptr, &error);
    QVERIFY2(artifact != nullptr, qPrintable(error));

    QCOMPARE(artifact->artifactId(), QStringLiteral("fixture-artifact-v1"));
    QCOMPARE(artifact->labels(),
             (QStringList{QStringLiteral("Tecnologia"), QStringLiteral("Artes")}));
    QCOMPARE(artifact->areaOrder(),
             (QStringList{QStringLiteral("Artes"), QStringLiteral("Tecnologia")}));

    const im::EmbeddingDescriptor& embedder = artifact->embeddingDescriptor();
    QCOMPARE(embedder.identity, QStringLiteral("test/tiny-embedder"));
    QCOMPARE(embedder.dimensions, 3);
    QCOMPARE(embedder.fallbacks, QStringList{QStringLiteral("test/backup-embedder")});

    QCOMPARE(artifact->scaler().inputDimension(), 21);
    QCOMPARE(artifact->keywordWeights().size(), size_t(5));
    QCOMPARE(artifact->keywordWeights().at(QStringLiteral("arte")).at(QStringLiteral("Artes")), 1.5);

    // The unbalanced "(" pattern is skipped, the rest compile.
    QCOMPARE(artifact->categoryPatterns().at(QStringLiteral("Tecnologia")).size(), size_t(2));
    QCOMPARE(artifact->categoryPatterns().at(QStringLiteral("Artes")).size(), size_t(1));

    QCOMPARE(artifact->categoryVocabulary().at(QStringLiteral("Tecnologia")).size(), qsizetype(4));
    QVERIFY(artifact->categoryVocabulary().at(QStringLiteral("Artes")).contains(QStringLiteral("pintar")));
}

void TestFileModelArtifact::testFixturePrediction()
{
    auto artifact = im::FileModelArtifact::load(im::test::artifactFixtureDir(), nullptr);
    QVERIFY(artifact != nullptr);

    std::vector<double> features(21, 0.0);
    features[3] = 3.75;
    features[7] = 3.5;

    const auto proba = artifact->predictProba(features);
    QVERIFY(proba.has_value());
    QCOMPARE(proba->size(), size_t(2));
    const double artes = 1.0 / (1.0 + std::exp(-0.25));
    QCOMPARE(proba->at(1), artes);
    QCOMPARE(proba->at(0), 1.0 - artes);

    QString error;
    QVERIFY(!artifact->predictProba(std::vector<double>(5, 0.0), &error).has_value());
    QVERIFY(!error.isEmpty());
}

void TestFileModelArtifact::testMissingDirectoryFails()
{
    QString error;
    auto artifact = im::FileModelArtifact::load(QStringLiteral("/definitely/missing/artifact"),
                                                nullptr, &error);
    QVERIFY(artifact == nullptr);
    QVERIFY(error.contains(QStringLiteral("artifact.json")));
}

void TestFileModelArtifact::testMalformedJsonFails()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QFile file(dir.filePath(QStringLiteral("artifact.json")));
    QVERIFY(file.open(QIODevice::WriteOnly));
    QVERIFY(file.write("{ not json") > 0);
    file.close();

    QString error;
    QVERIFY(im::FileModelArtifact::load(dir.path(), nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("invalid JSON")));
}

void TestFileModelArtifact::testUnsupportedClassifierTypeFails()
{
    QJsonObject scaler;
    scaler.insert(QStringLiteral("mean"), QJsonArray{0.0});
    scaler.insert(QStringLiteral("scale"), QJsonArray{1.0});
    QJsonObject classifier;
    classifier.insert(QStringLiteral("type"), QStringLiteral("random_forest"));

    QJsonObject root;
    root.insert(QStringLiteral("labels"), QJsonArray{QStringLiteral("A")});
    root.insert(QStringLiteral("scaler"), scaler);
    root.insert(QStringLiteral("classifier"), classifier);

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(im::test::writeJsonFile(dir.filePath(QStringLiteral("artifact.json")), root));

    QString error;
    QVERIFY(im::FileModelArtifact::load(dir.path(), nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("random_forest")));
}

void TestFileModelArtifact::testMissingClassifierSectionFails()
{
    QJsonObject scaler;
    scaler.insert(QStringLiteral("mean"), QJsonArray{0.0});
    scaler.insert(QStringLiteral("scale"), QJsonArray{1.0});
    QJsonObject root;
    root.insert(QStringLiteral("labels"), QJsonArray{QStringLiteral("A")});
    root.insert(QStringLiteral("scaler"), scaler);

    QString error;
    QVERIFY(!im::ArtifactManifest::loadFromJson(root, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("classifier")));
}

void TestFileModelArtifact::testEmptyLabelsFail()
{
    QString error;
    QVERIFY(im::FileModelArtifact::fromManifest(makeManifest({}, 4), nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("labels")));
}

void TestFileModelArtifact::testScalerLengthMismatchFails()
{
    im::ArtifactManifest manifest = makeManifest({QStringLiteral("A"), QStringLiteral("B")}, 4);
    manifest.scalerScale.pop_back();

    QString error;
    QVERIFY(im::FileModelArtifact::fromManifest(manifest, nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("scaler")));
}

void TestFileModelArtifact::testClassifierWidthMismatchFails()
{
    im::ArtifactManifest manifest = makeManifest({QStringLiteral("A"), QStringLiteral("B")}, 4);
    for (auto& row : manifest.classifier.coefficients) {
        row.push_back(0.0);
    }

    QString error;
    QVERIFY(im::FileModelArtifact::fromManifest(manifest, nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("expects 5 features")));
}

void TestFileModelArtifact::testClassCountMismatchFails()
{
    im::ArtifactManifest manifest = makeManifest(
        {QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")}, 4);
    manifest.classifier.coefficients.pop_back();
    manifest.classifier.intercepts.pop_back();

    QString error;
    QVERIFY(im::FileModelArtifact::fromManifest(manifest, nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("3 labels")));
}

void TestFileModelArtifact::testOnnxClassifierWithoutRegistryFails()
{
    im::ArtifactManifest manifest = makeManifest({QStringLiteral("A"), QStringLiteral("B")}, 4);
    manifest.classifier.type = QStringLiteral("onnx");

    QString error;
    QVERIFY(im::FileModelArtifact::fromManifest(manifest, nullptr, &error) == nullptr);
    QVERIFY(error.contains(QStringLiteral("registry")));
}

void TestFileModelArtifact::testAreaOrderDefaultsToVocabularyKeys()
{
    im::ArtifactManifest manifest = makeManifest({QStringLiteral("Zeta"), QStringLiteral("Alpha")}, 4);
    manifest.vocabulary[QStringLiteral("Zeta")] = {QStringLiteral("z")};
    manifest.vocabulary[QStringLiteral("Beta")] = {QStringLiteral("b")};

    auto artifact = im::FileModelArtifact::fromManifest(manifest, nullptr);
    QVERIFY(artifact != nullptr);
    QCOMPARE(artifact->areaOrder(), (QStringList{QStringLiteral("Beta"), QStringLiteral("Zeta")}));
}

void TestFileModelArtifact::testAreaOrderDefaultsToSortedLabels()
{
    auto artifact = im::FileModelArtifact::fromManifest(
        makeManifest({QStringLiteral("Zeta"), QStringLiteral("Alpha")}, 4), nullptr);
    QVERIFY(artifact != nullptr);
    QCOMPARE(artifact->labels(), (QStringList{QStringLiteral("Zeta"), QStringLiteral("Alpha")}));
    QCOMPARE(artifact->areaOrder(), (QStringList{QStringLiteral("Alpha"), QStringLiteral("Zeta")}));
}

QTEST_MAIN(TestFileModelArtifact)
#include "test_file_model_artifact.moc"
