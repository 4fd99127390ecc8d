#pragma once

#include <QString>
#include <QJsonObject>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace im {

// One ONNX model in an artifact directory's manifest.json, keyed by role
// (for example "classifier" or an embedding provider identity).
struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    QString fallbackRole;
    QString task;             // "embedding" or "classifier"
    int dimensions = 0;       // embedding width, or classifier input width
    int maxSeqLength = 256;
    QString tokenizer;
    QString poolingStrategy = QStringLiteral("mean");  // "mean" or "cls"
    bool normalize = false;   // L2-normalize pooled embeddings
    std::vector<QString> inputs;
    std::vector<QString> outputs;
};

struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);

    // Roles whose task is "embedding", sorted by role name.
    std::vector<std::string> embeddingRoles() const;
};

} // namespace im
