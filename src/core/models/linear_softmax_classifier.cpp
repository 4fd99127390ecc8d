#include "core/models/linear_softmax_classifier.h"

#include <algorithm>
#include <cmath>

namespace im {

LinearSoftmaxClassifier::LinearSoftmaxClassifier(std::vector<std::vector<double>> coefficients,
                                                 std::vector<double> intercepts)
    : m_coefficients(std::move(coefficients))
    , m_intercepts(std::move(intercepts))
{
}

bool LinearSoftmaxClassifier::isValid() const
{
    if (m_coefficients.empty() || m_coefficients.size() != m_intercepts.size()) {
        return false;
    }
    const size_t width = m_coefficients.front().size();
    if (width == 0) {
        return false;
    }
    return std::all_of(m_coefficients.begin(), m_coefficients.end(),
                       [width](const std::vector<double>& row) { return row.size() == width; });
}

int LinearSoftmaxClassifier::inputDimension() const
{
    return m_coefficients.empty() ? 0 : static_cast<int>(m_coefficients.front().size());
}

int LinearSoftmaxClassifier::classCount() const
{
    if (m_coefficients.size() == 1) {
        return 2;
    }
    return static_cast<int>(m_coefficients.size());
}

std::optional<std::vector<double>> LinearSoftmaxClassifier::predictProba(
    const std::vector<double>& scaledFeatures, QString* errorOut) const
{
    if (!isValid()) {
        if (errorOut) {
            *errorOut = QStringLiteral("linear classifier has inconsistent coefficients");
        }
        return std::nullopt;
    }
    if (static_cast<int>(scaledFeatures.size()) != inputDimension()) {
        if (errorOut) {
            *errorOut = QStringLiteral("classifier expects %1 features, got %2")
                            .arg(inputDimension())
                            .arg(scaledFeatures.size());
        }
        return std::nullopt;
    }

    std::vector<double> logits(m_coefficients.size(), 0.0);
    for (size_t row = 0; row < m_coefficients.size(); ++row) {
        double z = m_intercepts[row];
        for (size_t col = 0; col < scaledFeatures.size(); ++col) {
            z += m_coefficients[row][col] * scaledFeatures[col];
        }
        logits[row] = z;
    }

    if (logits.size() == 1) {
        const double positive = 1.0 / (1.0 + std::exp(-logits.front()));
        return std::vector<double>{1.0 - positive, positive};
    }

    // Shift by the max logit so exp() cannot overflow.
    const double maxLogit = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (double& value : logits) {
        value = std::exp(value - maxLogit);
        sum += value;
    }
    for (double& value : logits) {
        value /= sum;
    }
    return logits;
}

} // namespace im
