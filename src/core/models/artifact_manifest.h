#pragma once

#include "core/models/model_artifact.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <vector>

namespace im {

struct ClassifierSpec {
    QString type;  // "linear_softmax" or "onnx"
    std::vector<std::vector<double>> coefficients;
    std::vector<double> intercepts;
    QString role = QStringLiteral("classifier");  // ModelRegistry role for "onnx"
};

// Parsed artifact.json. Structural checks only; consistency between the
// pieces is verified by FileModelArtifact.
struct ArtifactManifest {
    QString artifactId;
    QStringList labels;
    QStringList areaOrder;  // empty when the file does not declare one
    EmbeddingDescriptor embedder;
    std::vector<double> scalerMean;
    std::vector<double> scalerScale;
    KeywordTable keywords;
    std::map<QString, QStringList> patterns;    // area -> regex sources
    std::map<QString, QStringList> vocabulary;  // area -> words
    ClassifierSpec classifier;

    static std::optional<ArtifactManifest> loadFromFile(const QString& path,
                                                        QString* errorOut = nullptr);
    static std::optional<ArtifactManifest> loadFromJson(const QJsonObject& root,
                                                        QString* errorOut = nullptr);
};

} // namespace im
