#pragma once

#include "core/models/feature_scaler.h"

#include <QRegularExpression>
#include <QSet>
#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <vector>

namespace im {

// term -> (area -> weight)
using KeywordTable = std::map<QString, std::map<QString, double>>;
// area -> compiled patterns, in artifact order
using PatternTable = std::map<QString, std::vector<QRegularExpression>>;
// area -> vocabulary words
using VocabularyTable = std::map<QString, QSet<QString>>;

struct EmbeddingDescriptor {
    QString identity;
    int dimensions = 0;
    QStringList fallbacks;  // compatible providers, most preferred first
};

// Read-only capability surface of a pretrained text classifier and the
// tables it was trained with. Implementations must be safe to share across
// threads once constructed; predictProba() may be called concurrently unless
// the caller serializes it.
class ModelArtifact {
public:
    virtual ~ModelArtifact() = default;

    virtual QString artifactId() const = 0;

    // Classifier output index -> area.
    virtual const QStringList& labels() const = 0;

    // Area order used for every per-area feature block. Part of the
    // training contract; never recomputed by consumers.
    virtual const QStringList& areaOrder() const = 0;

    virtual const KeywordTable& keywordWeights() const = 0;
    virtual const PatternTable& categoryPatterns() const = 0;
    virtual const VocabularyTable& categoryVocabulary() const = 0;
    virtual const EmbeddingDescriptor& embeddingDescriptor() const = 0;
    virtual const FeatureScaler& scaler() const = 0;

    // Probability per label for one already-scaled feature vector.
    virtual std::optional<std::vector<double>> predictProba(
        const std::vector<double>& scaledFeatures, QString* errorOut = nullptr) const = 0;
};

} // namespace im
