#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>

#include <memory>
#include <vector>

namespace im {

class EmbeddingCache;
class InferenceWorker;
class ModelArtifact;
class TextFeatureExtractor;

// Area distribution for processed free text, via embedding + hand-crafted
// features + the artifact's classifier. Never throws and never fails the
// caller: every inference problem degrades to an empty map.
class TextClassifier {
public:
    // artifact may be null (no model installed); the classifier then stays
    // unavailable. cache may be null. Both must outlive the classifier.
    TextClassifier(const ModelArtifact* artifact,
                   std::vector<std::unique_ptr<EmbeddingProvider>> providers,
                   const EngineSettings& settings,
                   EmbeddingCache* cache = nullptr);
    ~TextClassifier();

    TextClassifier(const TextClassifier&) = delete;
    TextClassifier& operator=(const TextClassifier&) = delete;

    // Resolves an embedding provider compatible with the artifact. On
    // failure the text path stays disabled and errorOut explains why.
    bool initialize(QString* errorOut = nullptr);
    bool isAvailable() const;

    ScoreMap classify(const QString& processedText) const;

    // Identity of the resolved provider, empty when unavailable.
    QString embeddingProvider() const;

    // Embedding width the artifact's scaler leaves room for.
    int expectedEmbeddingDimensions() const;

private:
    ScoreMap runInference(const QString& processedText) const;
    std::vector<float> embedCached(const QString& processedText) const;

    const ModelArtifact* m_artifact = nullptr;
    std::vector<std::unique_ptr<EmbeddingProvider>> m_providers;
    EmbeddingProvider* m_provider = nullptr;
    EmbeddingCache* m_cache = nullptr;
    QStringList m_extraFallbacks;
    int m_minTextChars = 10;
    std::unique_ptr<TextFeatureExtractor> m_extractor;
    // Declared last: destroyed first, so no job outlives the members it uses.
    std::unique_ptr<InferenceWorker> m_worker;
};

} // namespace im
