#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <unordered_map>
#include <vector>

namespace im {

// ONNX sessions of one artifact directory, described by its manifest.json.
// A directory without a manifest is valid and simply has no models.
class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    // Lazy-creates and caches a ModelSession for the given role.
    // Follows fallbackRole links when a role fails to initialize.
    // Returns nullptr if no role in the chain can be initialized.
    ModelSession* getSession(const std::string& role);

    bool hasModel(const std::string& role) const;

    // Resolves the artifact directory. Search order:
    //   1. explicitDir, when non-empty
    //   2. $INTERESTMAPPER_MODELS_DIR
    //   3. data/models next to or above the executable
    //   4. $INTERESTMAPPER_SOURCE_DIR/data/models (compile-time)
    // The first candidate holding artifact.json wins; otherwise the first
    // candidate is returned so the load error names a concrete path.
    static QString resolveModelsDir(const QString& explicitDir = QString());

    const ModelManifest& manifest() const;
    const QString& modelsDir() const;

private:
    ModelSession* getSessionUnlocked(const std::string& role,
                                     std::unordered_set<std::string>& visited);

    QString m_modelsDir;
    ModelManifest m_manifest;
    std::unordered_map<std::string, std::unique_ptr<ModelSession>> m_sessions;
    mutable std::mutex m_mutex;
};

} // namespace im
