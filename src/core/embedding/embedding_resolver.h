#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/models/model_artifact.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

namespace im {

// Picks the embedding provider a classifier runs with. Candidates are tried
// in this order: the artifact's declared identity, the artifact's own
// fallbacks, extraFallbacks, then every remaining provider in registration
// order. The first provider that initializes and produces exactly
// requiredDimensions wins.
class EmbeddingResolver {
public:
    static QStringList candidateOrder(const std::vector<std::unique_ptr<EmbeddingProvider>>& providers,
                                      const EmbeddingDescriptor& declared,
                                      const QStringList& extraFallbacks);

    // Returns a non-owning pointer into providers, or nullptr with errorOut
    // describing every rejected candidate.
    static EmbeddingProvider* resolve(const std::vector<std::unique_ptr<EmbeddingProvider>>& providers,
                                      const EmbeddingDescriptor& declared,
                                      const QStringList& extraFallbacks,
                                      int requiredDimensions,
                                      QString* errorOut = nullptr);
};

} // namespace im
