#include "core/models/onnx_classifier_head.h"

#include "core/models/model_session.h"
#include "core/shared/logging.h"

#if defined(ONNXRUNTIME_FOUND)
#include <onnxruntime_cxx_api.h>
#endif

namespace im {

OnnxClassifierHead::OnnxClassifierHead(ModelSession* session, int inputDimension, int classCount)
    : m_session(session)
    , m_inputDimension(inputDimension)
    , m_classCount(classCount)
{
}

OnnxClassifierHead::~OnnxClassifierHead() = default;

bool OnnxClassifierHead::isAvailable() const
{
    return m_session != nullptr && m_session->isAvailable() && m_session->rawSession() != nullptr
        && !m_session->inputNames().empty();
}

int OnnxClassifierHead::inputDimension() const
{
    return m_inputDimension;
}

int OnnxClassifierHead::classCount() const
{
    return m_classCount;
}

std::optional<std::vector<double>> OnnxClassifierHead::predictProba(
    const std::vector<double>& scaledFeatures, QString* errorOut) const
{
    if (!isAvailable()) {
        if (errorOut) {
            *errorOut = QStringLiteral("ONNX classifier session unavailable");
        }
        return std::nullopt;
    }
    if (static_cast<int>(scaledFeatures.size()) != m_inputDimension) {
        if (errorOut) {
            *errorOut = QStringLiteral("classifier expects %1 features, got %2")
                            .arg(m_inputDimension)
                            .arg(scaledFeatures.size());
        }
        return std::nullopt;
    }

#if defined(ONNXRUNTIME_FOUND)
    auto* session = static_cast<Ort::Session*>(m_session->rawSession());
    std::vector<float> input(scaledFeatures.begin(), scaledFeatures.end());
    const int64_t inputShape[2] = {1, static_cast<int64_t>(m_inputDimension)};

    std::vector<const char*> outputNames;
    outputNames.reserve(m_session->outputNames().size());
    for (const std::string& name : m_session->outputNames()) {
        outputNames.push_back(name.c_str());
    }
    const char* inputNames[1] = {m_session->inputNames().front().c_str()};

    try {
        std::lock_guard<std::mutex> lock(m_runMutex);
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);
        Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
            memoryInfo, input.data(), input.size(), inputShape, 2);

        std::vector<Ort::Value> outputs = session->Run(Ort::RunOptions{nullptr},
                                                       inputNames,
                                                       &inputTensor,
                                                       1,
                                                       outputNames.data(),
                                                       outputNames.size());

        for (Ort::Value& output : outputs) {
            if (!output.IsTensor()) {
                continue;
            }
            Ort::TensorTypeAndShapeInfo info = output.GetTensorTypeAndShapeInfo();
            if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT
                || static_cast<int>(info.GetElementCount()) != m_classCount) {
                continue;
            }
            const float* data = output.GetTensorData<float>();
            return std::vector<double>(data, data + m_classCount);
        }

        if (errorOut) {
            *errorOut = QStringLiteral("ONNX classifier produced no %1-class probability tensor")
                            .arg(m_classCount);
        }
        return std::nullopt;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(imModel, "OnnxClassifierHead: inference failed: %s", ex.what());
        if (errorOut) {
            *errorOut = QString::fromUtf8(ex.what());
        }
        return std::nullopt;
    }
#else
    if (errorOut) {
        *errorOut = QStringLiteral("ONNX Runtime not enabled");
    }
    return std::nullopt;
#endif
}

} // namespace im
