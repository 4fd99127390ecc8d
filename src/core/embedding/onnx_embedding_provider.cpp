#include "core/embedding/onnx_embedding_provider.h"

#include "core/embedding/tokenizer.h"
#include "core/models/model_manifest.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <cmath>

#if defined(ONNXRUNTIME_FOUND)
#include <onnxruntime_cxx_api.h>
#endif

namespace im {

namespace {

int64_t nowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

void l2Normalize(std::vector<float>* embedding)
{
    double sumSquares = 0.0;
    for (const float value : *embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }
    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return;
    }
    for (float& value : *embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open, unless the half-open delay has elapsed: then allow one attempt.
    return nowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(nowMs());
}

class OnnxEmbeddingProvider::Impl {
public:
#if defined(ONNXRUNTIME_FOUND)
    Ort::Session* session = nullptr;  // Borrowed from ModelSession, not owned
    std::vector<std::string> inputNames;
    std::string outputName;
#endif
};

OnnxEmbeddingProvider::OnnxEmbeddingProvider(ModelRegistry* registry, std::string role)
    : m_impl(std::make_unique<Impl>())
    , m_registry(registry)
    , m_role(std::move(role))
    , m_identity(QString::fromStdString(m_role))
{
    if (!m_registry) {
        return;
    }
    const auto& models = m_registry->manifest().models;
    const auto it = models.find(m_role);
    if (it != models.end()) {
        m_identity = it->second.modelId;
        m_dimensions = it->second.dimensions;
        m_pooling = it->second.poolingStrategy;
        m_normalize = it->second.normalize;
    }
}

OnnxEmbeddingProvider::~OnnxEmbeddingProvider() = default;

std::vector<std::unique_ptr<EmbeddingProvider>> OnnxEmbeddingProvider::createAll(
    ModelRegistry* registry)
{
    std::vector<std::unique_ptr<EmbeddingProvider>> providers;
    if (!registry) {
        return providers;
    }
    for (const std::string& role : registry->manifest().embeddingRoles()) {
        providers.push_back(std::make_unique<OnnxEmbeddingProvider>(registry, role));
    }
    return providers;
}

QString OnnxEmbeddingProvider::identity() const
{
    return m_identity;
}

int OnnxEmbeddingProvider::dimensions() const
{
    return m_dimensions;
}

bool OnnxEmbeddingProvider::isAvailable() const
{
    return m_available;
}

bool OnnxEmbeddingProvider::initialize()
{
    if (m_initialized) {
        return m_available;
    }
    m_initialized = true;

#if defined(ONNXRUNTIME_FOUND)
    if (!m_registry) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: null registry for '%s'", m_role.c_str());
        return false;
    }

    ModelSession* modelSession = m_registry->getSession(m_role);
    if (!modelSession || !modelSession->isAvailable()) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: session for '%s' unavailable", m_role.c_str());
        return false;
    }

    const ModelManifestEntry& entry = modelSession->manifest();
    m_tokenizer = TokenizerFactory::create(entry, m_registry->modelsDir());
    if (!m_tokenizer) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: tokenizer creation failed for '%s'",
                 m_role.c_str());
        return false;
    }

    // A fallback role may have been initialized in place of the requested one.
    m_identity = entry.modelId;
    m_dimensions = entry.dimensions;
    m_pooling = entry.poolingStrategy;
    m_normalize = entry.normalize;
    if (m_dimensions <= 0) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: invalid dimensions %d for '%s'",
                 m_dimensions, m_role.c_str());
        return false;
    }

    m_impl->session = static_cast<Ort::Session*>(modelSession->rawSession());
    if (!m_impl->session || modelSession->outputNames().empty()) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: no usable ONNX session for '%s'",
                 m_role.c_str());
        return false;
    }
    m_impl->inputNames = modelSession->inputNames();
    m_impl->outputName = modelSession->outputNames().front();

    LOG_INFO(imModel, "OnnxEmbeddingProvider: '%s' ready (%d dims, %s pooling)",
             qUtf8Printable(m_identity), m_dimensions, qUtf8Printable(m_pooling));
    m_available = true;
    return true;
#else
    LOG_INFO(imModel, "OnnxEmbeddingProvider: ONNX Runtime not enabled, '%s' unavailable",
             m_role.c_str());
    return false;
#endif
}

std::vector<float> OnnxEmbeddingProvider::pool(const float* data,
                                               const std::vector<int64_t>& shape,
                                               const std::vector<int64_t>& attentionMask) const
{
    std::vector<float> embedding(static_cast<size_t>(m_dimensions), 0.0f);

    // [1, hidden]: the model pools internally.
    if (shape.size() == 2 && shape[0] == 1 && shape[1] == m_dimensions) {
        std::copy(data, data + m_dimensions, embedding.begin());
        return embedding;
    }

    if (shape.size() != 3 || shape[0] != 1 || shape[2] != m_dimensions || shape[1] < 1) {
        return {};
    }

    const int64_t seqLen = shape[1];
    if (m_pooling == QStringLiteral("cls")) {
        std::copy(data, data + m_dimensions, embedding.begin());
        return embedding;
    }

    double tokenCount = 0.0;
    for (int64_t t = 0; t < seqLen; ++t) {
        if (t < static_cast<int64_t>(attentionMask.size()) && attentionMask[t] == 0) {
            continue;
        }
        const float* row = data + t * m_dimensions;
        for (int j = 0; j < m_dimensions; ++j) {
            embedding[static_cast<size_t>(j)] += row[j];
        }
        tokenCount += 1.0;
    }
    if (tokenCount > 0.0) {
        for (float& value : embedding) {
            value = static_cast<float>(value / tokenCount);
        }
    }
    return embedding;
}

std::vector<float> OnnxEmbeddingProvider::embed(const QString& text)
{
#if defined(ONNXRUNTIME_FOUND)
    if (!m_available || !m_impl->session || !m_tokenizer) {
        return {};
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: circuit breaker open for '%s', skipping",
                 m_role.c_str());
        return {};
    }

    TokenizerOutput tokenized = m_tokenizer->tokenize(text);
    if (tokenized.seqLength <= 0) {
        return {};
    }

    const int64_t inputShape[2] = {1, static_cast<int64_t>(tokenized.seqLength)};

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);

        std::vector<Ort::Value> inputTensors;
        std::vector<const char*> inputNames;
        for (const std::string& name : m_impl->inputNames) {
            std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") {
                source = &tokenized.inputIds;
            } else if (name == "attention_mask") {
                source = &tokenized.attentionMask;
            } else if (name == "token_type_ids") {
                source = &tokenized.tokenTypeIds;
            } else {
                LOG_WARN(imModel, "OnnxEmbeddingProvider: unsupported model input '%s'",
                         name.c_str());
                m_circuitBreaker.recordFailure();
                return {};
            }
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, source->data(), source->size(), inputShape, 2));
            inputNames.push_back(name.c_str());
        }

        const char* outputNames[1] = {m_impl->outputName.c_str()};
        std::vector<Ort::Value> outputs = m_impl->session->Run(Ort::RunOptions{nullptr},
                                                               inputNames.data(),
                                                               inputTensors.data(),
                                                               inputTensors.size(),
                                                               outputNames,
                                                               1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(imModel, "OnnxEmbeddingProvider: missing tensor output for '%s'",
                     m_role.c_str());
            m_circuitBreaker.recordFailure();
            return {};
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        std::vector<float> embedding = pool(outputs[0].GetTensorData<float>(), shape,
                                            tokenized.attentionMask);
        if (embedding.empty()) {
            LOG_WARN(imModel, "OnnxEmbeddingProvider: unsupported output shape for '%s'",
                     m_role.c_str());
            m_circuitBreaker.recordFailure();
            return {};
        }

        if (m_normalize) {
            l2Normalize(&embedding);
        }
        m_circuitBreaker.recordSuccess();
        return embedding;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(imModel, "OnnxEmbeddingProvider: inference failed for '%s': %s",
                 m_role.c_str(), ex.what());
        m_circuitBreaker.recordFailure();
        return {};
    }
#else
    Q_UNUSED(text);
    return {};
#endif
}

} // namespace im
