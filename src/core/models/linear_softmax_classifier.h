#pragma once

#include "core/models/classifier_head.h"

#include <vector>

namespace im {

// Multinomial logistic regression exported as plain coefficients.
// With a single coefficient row the model is binary: the row scores the
// second class and probabilities are [1 - sigmoid(z), sigmoid(z)].
class LinearSoftmaxClassifier : public ClassifierHead {
public:
    LinearSoftmaxClassifier(std::vector<std::vector<double>> coefficients,
                            std::vector<double> intercepts);

    // Coefficient rows must share one width and match the intercept count.
    bool isValid() const;

    int inputDimension() const override;
    int classCount() const override;

    std::optional<std::vector<double>> predictProba(
        const std::vector<double>& scaledFeatures, QString* errorOut = nullptr) const override;

private:
    std::vector<std::vector<double>> m_coefficients;
    std::vector<double> m_intercepts;
};

} // namespace im
