#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace im {

// Final stage of a trained classifier: scaled features -> class probabilities.
class ClassifierHead {
public:
    virtual ~ClassifierHead() = default;

    virtual int inputDimension() const = 0;
    virtual int classCount() const = 0;

    virtual std::optional<std::vector<double>> predictProba(
        const std::vector<double>& scaledFeatures, QString* errorOut = nullptr) const = 0;
};

} // namespace im
