#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace im {

class ModelRegistry;
class WordPieceTokenizer;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Sentence embedding model run through ONNX Runtime. The manifest role
// supplies the model file, vocab, pooling strategy and output width.
class OnnxEmbeddingProvider : public EmbeddingProvider {
public:
    OnnxEmbeddingProvider(ModelRegistry* registry, std::string role);
    ~OnnxEmbeddingProvider() override;

    OnnxEmbeddingProvider(const OnnxEmbeddingProvider&) = delete;
    OnnxEmbeddingProvider& operator=(const OnnxEmbeddingProvider&) = delete;

    // One provider per embedding role in the registry's manifest.
    static std::vector<std::unique_ptr<EmbeddingProvider>> createAll(ModelRegistry* registry);

    QString identity() const override;
    int dimensions() const override;
    bool isAvailable() const override;
    bool initialize() override;
    std::vector<float> embed(const QString& text) override;

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    std::vector<float> pool(const float* data, const std::vector<int64_t>& shape,
                            const std::vector<int64_t>& attentionMask) const;

    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelRegistry* m_registry = nullptr;
    std::string m_role;
    QString m_identity;
    QString m_pooling;
    bool m_normalize = false;
    int m_dimensions = 0;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_initialized = false;
    bool m_available = false;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace im
