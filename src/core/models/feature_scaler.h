#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace im {

// Standard-score transform fitted at training time: (x - mean) / scale.
class FeatureScaler {
public:
    FeatureScaler() = default;
    FeatureScaler(std::vector<double> mean, std::vector<double> scale);

    bool isValid() const;
    int inputDimension() const;

    // Fails when the vector length differs from the fitted dimension.
    std::optional<std::vector<double>> transform(const std::vector<double>& features,
                                                 QString* errorOut = nullptr) const;

    const std::vector<double>& mean() const { return m_mean; }
    const std::vector<double>& scale() const { return m_scale; }

private:
    std::vector<double> m_mean;
    std::vector<double> m_scale;
};

} // namespace im
