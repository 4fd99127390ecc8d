#include "core/models/feature_scaler.h"

#include <utility>

namespace im {

FeatureScaler::FeatureScaler(std::vector<double> mean, std::vector<double> scale)
    : m_mean(std::move(mean))
    , m_scale(std::move(scale))
{
}

bool FeatureScaler::isValid() const
{
    return !m_mean.empty() && m_mean.size() == m_scale.size();
}

int FeatureScaler::inputDimension() const
{
    return isValid() ? static_cast<int>(m_mean.size()) : 0;
}

std::optional<std::vector<double>> FeatureScaler::transform(const std::vector<double>& features,
                                                            QString* errorOut) const
{
    if (!isValid() || features.size() != m_mean.size()) {
        if (errorOut) {
            *errorOut = QStringLiteral("Scaler expects %1 features, got %2")
                            .arg(inputDimension())
                            .arg(features.size());
        }
        return std::nullopt;
    }

    std::vector<double> scaled(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        // A zero scale marks a constant training column; it is only centered.
        const double scale = (m_scale[i] == 0.0) ? 1.0 : m_scale[i];
        scaled[i] = (features[i] - m_mean[i]) / scale;
    }
    return scaled;
}

} // namespace im
