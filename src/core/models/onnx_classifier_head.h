#pragma once

#include "core/models/classifier_head.h"

#include <memory>
#include <mutex>
#include <string>

namespace im {

class ModelSession;

// Classifier exported to ONNX (for example with skl2onnx, zipmap disabled).
// Takes one float tensor [1, inputDimension] and reads the first float
// output whose element count equals the class count.
class OnnxClassifierHead : public ClassifierHead {
public:
    OnnxClassifierHead(ModelSession* session, int inputDimension, int classCount);
    ~OnnxClassifierHead() override;

    OnnxClassifierHead(const OnnxClassifierHead&) = delete;
    OnnxClassifierHead& operator=(const OnnxClassifierHead&) = delete;

    bool isAvailable() const;

    int inputDimension() const override;
    int classCount() const override;

    std::optional<std::vector<double>> predictProba(
        const std::vector<double>& scaledFeatures, QString* errorOut = nullptr) const override;

private:
    ModelSession* m_session = nullptr;  // owned by ModelRegistry
    int m_inputDimension = 0;
    int m_classCount = 0;
    mutable std::mutex m_runMutex;
};

} // namespace im
