#include "core/classification/text_classifier.h"

#include "core/classification/inference_worker.h"
#include "core/embedding/embedding_cache.h"
#include "core/embedding/embedding_resolver.h"
#include "core/models/model_artifact.h"
#include "core/shared/logging.h"
#include "core/text/text_feature_extractor.h"

#include <exception>

namespace im {

TextClassifier::TextClassifier(const ModelArtifact* artifact,
                               std::vector<std::unique_ptr<EmbeddingProvider>> providers,
                               const EngineSettings& settings,
                               EmbeddingCache* cache)
    : m_artifact(artifact)
    , m_providers(std::move(providers))
    , m_cache(cache)
    , m_extraFallbacks(settings.embeddingFallbacks)
    , m_minTextChars(settings.minTextChars)
    , m_worker(std::make_unique<InferenceWorker>(settings.inferenceTimeoutMs))
{
    if (m_artifact) {
        m_extractor = std::make_unique<TextFeatureExtractor>(*m_artifact);
    }
}

TextClassifier::~TextClassifier() = default;

int TextClassifier::expectedEmbeddingDimensions() const
{
    if (!m_artifact) {
        return 0;
    }
    return m_artifact->scaler().inputDimension()
        - TextFeatureExtractor::manualFeatureCount(static_cast<int>(m_artifact->areaOrder().size()));
}

bool TextClassifier::initialize(QString* errorOut)
{
    m_provider = nullptr;
    if (!m_artifact) {
        if (errorOut) {
            *errorOut = QStringLiteral("no model artifact loaded");
        }
        return false;
    }

    QString resolveError;
    m_provider = EmbeddingResolver::resolve(m_providers,
                                            m_artifact->embeddingDescriptor(),
                                            m_extraFallbacks,
                                            expectedEmbeddingDimensions(),
                                            &resolveError);
    if (!m_provider) {
        LOG_WARN(imModel, "Model incompatible, text analysis disabled: %s",
                 qUtf8Printable(resolveError));
        if (errorOut) {
            *errorOut = resolveError;
        }
        return false;
    }
    return true;
}

bool TextClassifier::isAvailable() const
{
    return m_provider != nullptr;
}

QString TextClassifier::embeddingProvider() const
{
    return m_provider ? m_provider->identity() : QString();
}

std::vector<float> TextClassifier::embedCached(const QString& processedText) const
{
    const QString providerId = m_provider->identity();
    if (m_cache) {
        std::optional<std::vector<float>> cached = m_cache->get(providerId, processedText);
        if (cached.has_value()) {
            return std::move(cached.value());
        }
    }

    std::vector<float> embedding = m_provider->embed(processedText);
    if (m_cache && !embedding.empty()) {
        m_cache->put(providerId, processedText, embedding);
    }
    return embedding;
}

ScoreMap TextClassifier::runInference(const QString& processedText) const
{
    const std::vector<float> embedding = embedCached(processedText);
    const int expected = expectedEmbeddingDimensions();
    if (static_cast<int>(embedding.size()) != expected) {
        LOG_WARN(imText, "Classification failed: embedding has %zu dims, expected %d",
                 embedding.size(), expected);
        return {};
    }

    const std::vector<double> features = m_extractor->buildFeatureVector(processedText, embedding);

    QString error;
    const std::optional<std::vector<double>> scaled = m_artifact->scaler().transform(features, &error);
    if (!scaled.has_value()) {
        LOG_WARN(imText, "Classification failed: %s", qUtf8Printable(error));
        return {};
    }

    const std::optional<std::vector<double>> proba = m_artifact->predictProba(scaled.value(), &error);
    if (!proba.has_value()) {
        LOG_WARN(imText, "Classification failed: %s", qUtf8Printable(error));
        return {};
    }

    const QStringList& labels = m_artifact->labels();
    if (static_cast<int>(proba->size()) != labels.size()) {
        LOG_WARN(imText, "Classification failed: %zu probabilities for %d labels",
                 proba->size(), static_cast<int>(labels.size()));
        return {};
    }

    ScoreMap raw;
    for (int i = 0; i < labels.size(); ++i) {
        const double p = proba->at(static_cast<size_t>(i));
        if (p > 0.0) {
            raw[labels.at(i)] += p;
        }
    }
    return normalizeByMax(raw);
}

ScoreMap TextClassifier::classify(const QString& processedText) const
{
    if (processedText.size() < m_minTextChars) {
        return {};
    }
    if (!isAvailable()) {
        return {};
    }

    // Captures by value: a timed-out job may still run after this returns.
    const QString text = processedText;
    std::optional<ScoreMap> result = m_worker->run([this, text]() {
        return runInference(text);
    });
    if (!result.has_value()) {
        LOG_WARN(imText, "Classification failed or timed out, ignoring free text");
        return {};
    }
    return std::move(result.value());
}

} // namespace im
