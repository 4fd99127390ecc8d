#include "core/embedding/embedding_resolver.h"

#include "core/shared/logging.h"

namespace im {

namespace {

EmbeddingProvider* findProvider(const std::vector<std::unique_ptr<EmbeddingProvider>>& providers,
                                const QString& identity)
{
    for (const auto& provider : providers) {
        if (provider && provider->identity() == identity) {
            return provider.get();
        }
    }
    return nullptr;
}

} // namespace

QStringList EmbeddingResolver::candidateOrder(
    const std::vector<std::unique_ptr<EmbeddingProvider>>& providers,
    const EmbeddingDescriptor& declared,
    const QStringList& extraFallbacks)
{
    QStringList order;
    if (!declared.identity.isEmpty()) {
        order.append(declared.identity);
    }
    order.append(declared.fallbacks);
    order.append(extraFallbacks);
    for (const auto& provider : providers) {
        if (provider) {
            order.append(provider->identity());
        }
    }
    order.removeAll(QString());
    order.removeDuplicates();
    return order;
}

EmbeddingProvider* EmbeddingResolver::resolve(
    const std::vector<std::unique_ptr<EmbeddingProvider>>& providers,
    const EmbeddingDescriptor& declared,
    const QStringList& extraFallbacks,
    int requiredDimensions,
    QString* errorOut)
{
    QStringList rejected;

    if (requiredDimensions <= 0) {
        rejected.append(QStringLiteral("artifact leaves no room for an embedding (%1 dims)")
                            .arg(requiredDimensions));
    } else {
        if (declared.dimensions > 0 && declared.dimensions != requiredDimensions) {
            LOG_WARN(imModel, "Artifact declares %d embedding dims but its scaler implies %d",
                     declared.dimensions, requiredDimensions);
        }

        const QStringList order = candidateOrder(providers, declared, extraFallbacks);
        for (const QString& identity : order) {
            EmbeddingProvider* provider = findProvider(providers, identity);
            if (!provider) {
                rejected.append(QStringLiteral("%1: not installed").arg(identity));
                continue;
            }
            if (provider->dimensions() > 0 && provider->dimensions() != requiredDimensions) {
                rejected.append(QStringLiteral("%1: %2 dims").arg(identity).arg(provider->dimensions()));
                continue;
            }
            if (!provider->initialize() || !provider->isAvailable()) {
                rejected.append(QStringLiteral("%1: unavailable").arg(identity));
                continue;
            }
            // Dimensions are only authoritative after initialization.
            if (provider->dimensions() != requiredDimensions) {
                rejected.append(QStringLiteral("%1: %2 dims").arg(identity).arg(provider->dimensions()));
                continue;
            }

            if (identity != declared.identity) {
                LOG_WARN(imModel, "Embedding provider '%s' unavailable, using fallback '%s'",
                         qUtf8Printable(declared.identity), qUtf8Printable(identity));
            } else {
                LOG_INFO(imModel, "Embedding provider '%s' resolved", qUtf8Printable(identity));
            }
            return provider;
        }
    }

    const QString message = QStringLiteral("no embedding provider produces %1 dimensions (%2)")
                                .arg(requiredDimensions)
                                .arg(rejected.join(QStringLiteral("; ")));
    if (errorOut) {
        *errorOut = message;
    }
    return nullptr;
}

} // namespace im
