#include "core/models/file_model_artifact.h"

#include "core/models/linear_softmax_classifier.h"
#include "core/models/model_registry.h"
#include "core/models/onnx_classifier_head.h"
#include "core/shared/logging.h"

#include <QDir>

namespace im {

namespace {

std::unique_ptr<FileModelArtifact> fail(QString* errorOut, const QString& message)
{
    LOG_WARN(imModel, "Artifact load failed: %s", qUtf8Printable(message));
    if (errorOut) {
        *errorOut = message;
    }
    return nullptr;
}

std::unique_ptr<ClassifierHead> createHead(const ClassifierSpec& spec,
                                           int inputDimension,
                                           int classCount,
                                           ModelRegistry* registry,
                                           QString* errorOut)
{
    if (spec.type == QStringLiteral("linear_softmax")) {
        auto head = std::make_unique<LinearSoftmaxClassifier>(spec.coefficients, spec.intercepts);
        if (!head->isValid()) {
            *errorOut = QStringLiteral("classifier coefficients and intercepts are inconsistent");
            return nullptr;
        }
        return head;
    }

    if (!registry) {
        *errorOut = QStringLiteral("ONNX classifier requires a model registry");
        return nullptr;
    }
    ModelSession* session = registry->getSession(spec.role.toStdString());
    auto head = std::make_unique<OnnxClassifierHead>(session, inputDimension, classCount);
    if (!head->isAvailable()) {
        *errorOut = QStringLiteral("ONNX classifier role '%1' could not be initialized")
                        .arg(spec.role);
        return nullptr;
    }
    return head;
}

} // namespace

std::unique_ptr<FileModelArtifact> FileModelArtifact::load(const QString& dir,
                                                           ModelRegistry* registry,
                                                           QString* errorOut)
{
    const QString path = QDir(dir).filePath(QStringLiteral("artifact.json"));
    QString parseError;
    std::optional<ArtifactManifest> manifest = ArtifactManifest::loadFromFile(path, &parseError);
    if (!manifest.has_value()) {
        return fail(errorOut, parseError);
    }
    return fromManifest(std::move(manifest.value()), registry, errorOut);
}

std::unique_ptr<FileModelArtifact> FileModelArtifact::fromManifest(ArtifactManifest manifest,
                                                                   ModelRegistry* registry,
                                                                   QString* errorOut)
{
    if (manifest.labels.isEmpty()) {
        return fail(errorOut, QStringLiteral("artifact declares no labels"));
    }

    FeatureScaler scaler(std::move(manifest.scalerMean), std::move(manifest.scalerScale));
    if (!scaler.isValid()) {
        return fail(errorOut, QStringLiteral("scaler mean and scale lengths differ or are empty"));
    }

    const int classCount = static_cast<int>(manifest.labels.size());
    QString headError;
    std::unique_ptr<ClassifierHead> head = createHead(
        manifest.classifier, scaler.inputDimension(), classCount, registry, &headError);
    if (!head) {
        return fail(errorOut, headError);
    }
    if (head->inputDimension() != scaler.inputDimension()) {
        return fail(errorOut, QStringLiteral("classifier expects %1 features, scaler has %2")
                                  .arg(head->inputDimension())
                                  .arg(scaler.inputDimension()));
    }
    if (head->classCount() != classCount) {
        return fail(errorOut, QStringLiteral("classifier has %1 classes for %2 labels")
                                  .arg(head->classCount())
                                  .arg(classCount));
    }

    auto artifact = std::make_unique<FileModelArtifact>(ConstructionTag{});
    artifact->m_artifactId = manifest.artifactId;
    artifact->m_labels = manifest.labels;
    artifact->m_keywords = std::move(manifest.keywords);
    artifact->m_embedder = manifest.embedder;
    artifact->m_scaler = std::move(scaler);
    artifact->m_head = std::move(head);

    for (const auto& [area, words] : manifest.vocabulary) {
        QSet<QString>& set = artifact->m_vocabulary[area];
        for (const QString& word : words) {
            set.insert(word);
        }
    }

    for (const auto& [area, sources] : manifest.patterns) {
        std::vector<QRegularExpression>& compiled = artifact->m_patterns[area];
        for (const QString& source : sources) {
            QRegularExpression re(source, QRegularExpression::UseUnicodePropertiesOption);
            if (!re.isValid()) {
                LOG_WARN(imModel, "Artifact: skipping invalid pattern '%s' for '%s': %s",
                         qUtf8Printable(source), qUtf8Printable(area),
                         qUtf8Printable(re.errorString()));
                continue;
            }
            compiled.push_back(std::move(re));
        }
    }

    if (!manifest.areaOrder.isEmpty()) {
        artifact->m_areaOrder = manifest.areaOrder;
    } else if (!manifest.vocabulary.empty()) {
        // std::map iteration is already sorted
        for (const auto& [area, words] : manifest.vocabulary) {
            Q_UNUSED(words);
            artifact->m_areaOrder.append(area);
        }
    } else {
        artifact->m_areaOrder = manifest.labels;
        artifact->m_areaOrder.sort();
    }

    LOG_INFO(imModel, "Artifact '%s' loaded: %d labels, %d feature dims, %zu keywords",
             qUtf8Printable(artifact->m_artifactId), classCount,
             artifact->m_scaler.inputDimension(), artifact->m_keywords.size());
    return artifact;
}

QString FileModelArtifact::artifactId() const
{
    return m_artifactId;
}

const QStringList& FileModelArtifact::labels() const
{
    return m_labels;
}

const QStringList& FileModelArtifact::areaOrder() const
{
    return m_areaOrder;
}

const KeywordTable& FileModelArtifact::keywordWeights() const
{
    return m_keywords;
}

const PatternTable& FileModelArtifact::categoryPatterns() const
{
    return m_patterns;
}

const VocabularyTable& FileModelArtifact::categoryVocabulary() const
{
    return m_vocabulary;
}

const EmbeddingDescriptor& FileModelArtifact::embeddingDescriptor() const
{
    return m_embedder;
}

const FeatureScaler& FileModelArtifact::scaler() const
{
    return m_scaler;
}

std::optional<std::vector<double>> FileModelArtifact::predictProba(
    const std::vector<double>& scaledFeatures, QString* errorOut) const
{
    return m_head->predictProba(scaledFeatures, errorOut);
}

} // namespace im
