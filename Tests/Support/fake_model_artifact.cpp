#include "Support/fake_model_artifact.h"

#include "core/text/text_feature_extractor.h"

#include <stdexcept>

namespace im::test {

FakeModelArtifact::FakeModelArtifact(QStringList labels, int embeddingDimensions)
    : m_labels(std::move(labels))
{
    m_areaOrder = m_labels;
    m_areaOrder.sort();

    m_embedder.identity = QStringLiteral("test/fake-embedder");
    m_embedder.dimensions = embeddingDimensions;

    const int width = embeddingDimensions
        + TextFeatureExtractor::manualFeatureCount(static_cast<int>(m_areaOrder.size()));
    m_scaler = FeatureScaler(std::vector<double>(static_cast<size_t>(width), 0.0),
                             std::vector<double>(static_cast<size_t>(width), 1.0));

    const double uniform = m_labels.isEmpty() ? 0.0 : 1.0 / m_labels.size();
    m_probabilities.assign(static_cast<size_t>(m_labels.size()), uniform);
}

std::optional<std::vector<double>> FakeModelArtifact::predictProba(
    const std::vector<double>& scaledFeatures, QString* errorOut) const
{
    m_predictCalls.fetch_add(1);
    m_lastFeatureCount.store(static_cast<int>(scaledFeatures.size()));
    if (m_throwOnPredict) {
        throw std::runtime_error("fake classifier failure");
    }
    if (m_failPredict) {
        if (errorOut) {
            *errorOut = QStringLiteral("fake classifier rejected input");
        }
        return std::nullopt;
    }
    return m_probabilities;
}

} // namespace im::test
