#pragma once

#include <QString>

#include <vector>

namespace im {

// A source of fixed-width sentence embeddings, identified by the model id it
// reproduces (for example "sentence-transformers/all-MiniLM-L6-v2").
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual QString identity() const = 0;
    virtual int dimensions() const = 0;
    virtual bool isAvailable() const = 0;

    // Loads whatever the provider needs. Called lazily by EmbeddingResolver,
    // so unused providers never touch their model files.
    virtual bool initialize() = 0;

    // Empty vector on failure. Not required to be reentrant; callers
    // serialize access (see InferenceWorker).
    virtual std::vector<float> embed(const QString& text) = 0;
};

} // namespace im
