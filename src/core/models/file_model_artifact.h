#pragma once

#include "core/models/artifact_manifest.h"
#include "core/models/classifier_head.h"
#include "core/models/model_artifact.h"

#include <QString>

#include <memory>

namespace im {

class ModelRegistry;

// ModelArtifact loaded once from an artifact directory (artifact.json plus,
// for ONNX classifiers, the models listed in manifest.json). Immutable after
// construction.
class FileModelArtifact : public ModelArtifact {
    struct ConstructionTag {};

public:
    // Use load() or fromManifest().
    explicit FileModelArtifact(ConstructionTag) {}

    // Returns nullptr and fills errorOut when the artifact is missing,
    // malformed, or internally inconsistent. registry is only consulted for
    // "onnx" classifiers and must outlive the artifact.
    static std::unique_ptr<FileModelArtifact> load(const QString& dir,
                                                   ModelRegistry* registry,
                                                   QString* errorOut = nullptr);

    static std::unique_ptr<FileModelArtifact> fromManifest(ArtifactManifest manifest,
                                                           ModelRegistry* registry,
                                                           QString* errorOut = nullptr);

    QString artifactId() const override;
    const QStringList& labels() const override;
    const QStringList& areaOrder() const override;
    const KeywordTable& keywordWeights() const override;
    const PatternTable& categoryPatterns() const override;
    const VocabularyTable& categoryVocabulary() const override;
    const EmbeddingDescriptor& embeddingDescriptor() const override;
    const FeatureScaler& scaler() const override;

    std::optional<std::vector<double>> predictProba(
        const std::vector<double>& scaledFeatures, QString* errorOut = nullptr) const override;

private:
    QString m_artifactId;
    QStringList m_labels;
    QStringList m_areaOrder;
    KeywordTable m_keywords;
    PatternTable m_patterns;
    VocabularyTable m_vocabulary;
    EmbeddingDescriptor m_embedder;
    FeatureScaler m_scaler;
    std::unique_ptr<ClassifierHead> m_head;
};

} // namespace im
