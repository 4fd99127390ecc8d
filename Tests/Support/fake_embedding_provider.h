#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

#include <atomic>
#include <vector>

namespace im::test {

class FakeEmbeddingProvider : public EmbeddingProvider {
public:
    FakeEmbeddingProvider(QString identity, int dimensions, bool available = true);

    QString identity() const override { return m_identity; }
    int dimensions() const override { return m_dimensions; }
    bool isAvailable() const override { return m_initialized && m_available; }
    bool initialize() override;
    std::vector<float> embed(const QString& text) override;

    // Returned by embed(); defaults to zeros of the declared width.
    void setEmbedding(std::vector<float> embedding) { m_embedding = std::move(embedding); }
    void setDelayMs(int delayMs) { m_delayMs = delayMs; }
    void setThrowOnEmbed(bool enabled) { m_throwOnEmbed = enabled; }
    // Throws a value that is not a std::exception.
    void setThrowNonStandard(bool enabled) { m_throwNonStandard = enabled; }

    int embedCalls() const { return m_embedCalls.load(); }
    int initializeCalls() const { return m_initializeCalls.load(); }
    // Highest number of embed() calls seen running at the same time.
    int maxConcurrentEmbeds() const { return m_maxConcurrentEmbeds.load(); }

private:
    QString m_identity;
    int m_dimensions = 0;
    bool m_available = true;
    bool m_initialized = false;
    std::vector<float> m_embedding;
    int m_delayMs = 0;
    bool m_throwOnEmbed = false;
    bool m_throwNonStandard = false;
    std::atomic<int> m_activeEmbeds{0};
    std::atomic<int> m_maxConcurrentEmbeds{0};
    std::atomic<int> m_embedCalls{0};
    std::atomic<int> m_initializeCalls{0};
};

} // namespace im::test
