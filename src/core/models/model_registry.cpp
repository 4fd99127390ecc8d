#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QProcessEnvironment>

namespace im {

namespace {

const QString kArtifactFile = QStringLiteral("artifact.json");

QStringList modelDirCandidates(const QString& explicitDir)
{
    QStringList candidates;
    if (!explicitDir.isEmpty()) {
        candidates << QDir::cleanPath(explicitDir);
    }

    const QString envModelDir = QProcessEnvironment::systemEnvironment().value(
        QStringLiteral("INTERESTMAPPER_MODELS_DIR"));
    if (!envModelDir.isEmpty()) {
        candidates << QDir::cleanPath(envModelDir);
    }

    if (QCoreApplication::instance() != nullptr) {
        const QString appDir = QCoreApplication::applicationDirPath();
        candidates << QDir::cleanPath(appDir + QStringLiteral("/data/models"));
        candidates << QDir::cleanPath(appDir + QStringLiteral("/../data/models"));
        candidates << QDir::cleanPath(appDir + QStringLiteral("/../../data/models"));
    }

#ifdef INTERESTMAPPER_SOURCE_DIR
    candidates << QDir::cleanPath(QString::fromUtf8(INTERESTMAPPER_SOURCE_DIR)
                                  + QStringLiteral("/data/models"));
#endif

    candidates.removeDuplicates();
    return candidates;
}

} // namespace

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(modelsDir)
{
    const QString manifestPath = m_modelsDir + QStringLiteral("/manifest.json");
    if (!QFile::exists(manifestPath)) {
        LOG_INFO(imModel, "ModelRegistry: no manifest.json in %s, no ONNX models available",
                 qPrintable(m_modelsDir));
        return;
    }

    std::optional<ModelManifest> loaded = ModelManifest::loadFromFile(manifestPath);
    if (loaded.has_value()) {
        m_manifest = std::move(loaded.value());
        LOG_INFO(imModel, "ModelRegistry: loaded manifest with %zu model(s) from %s",
                 m_manifest.models.size(), qPrintable(manifestPath));
    } else {
        LOG_WARN(imModel, "ModelRegistry: failed to load manifest from %s",
                 qPrintable(manifestPath));
    }
}

ModelRegistry::~ModelRegistry() = default;

ModelSession* ModelRegistry::getSession(const std::string& role)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::unordered_set<std::string> visited;
    visited.insert(role);
    return getSessionUnlocked(role, visited);
}

ModelSession* ModelRegistry::getSessionUnlocked(const std::string& role,
                                                std::unordered_set<std::string>& visited)
{
    auto sessionIt = m_sessions.find(role);
    if (sessionIt != m_sessions.end()) {
        return sessionIt->second.get();
    }

    auto manifestIt = m_manifest.models.find(role);
    if (manifestIt == m_manifest.models.end()) {
        LOG_WARN(imModel, "ModelRegistry: no manifest entry for role '%s'", role.c_str());
        return nullptr;
    }

    const ModelManifestEntry& entry = manifestIt->second;
    const QString modelPath = m_modelsDir + QStringLiteral("/") + entry.file;

    auto session = std::make_unique<ModelSession>(entry);
    if (!session->initialize(modelPath)) {
        if (!entry.fallbackRole.isEmpty()) {
            const std::string fallbackRole = entry.fallbackRole.toStdString();
            if (!visited.count(fallbackRole)) {
                visited.insert(fallbackRole);
                LOG_WARN(imModel,
                         "ModelRegistry: role '%s' failed to initialize, trying fallback '%s'",
                         role.c_str(), fallbackRole.c_str());
                return getSessionUnlocked(fallbackRole, visited);
            }
        }
        LOG_WARN(imModel, "ModelRegistry: failed to initialize session for role '%s'",
                 role.c_str());
        return nullptr;
    }

    ModelSession* raw = session.get();
    m_sessions[role] = std::move(session);
    return raw;
}

bool ModelRegistry::hasModel(const std::string& role) const
{
    return m_manifest.models.find(role) != m_manifest.models.end();
}

QString ModelRegistry::resolveModelsDir(const QString& explicitDir)
{
    const QStringList candidates = modelDirCandidates(explicitDir);

    for (const QString& dir : candidates) {
        if (QFile::exists(dir + QStringLiteral("/") + kArtifactFile)) {
            LOG_INFO(imModel, "ModelRegistry: resolved models dir to %s", qPrintable(dir));
            return dir;
        }
    }

    LOG_WARN(imModel, "ModelRegistry: %s not found in any candidate dir. Searched: %s",
             qPrintable(kArtifactFile), qPrintable(candidates.join(QStringLiteral(", "))));

    return candidates.isEmpty() ? QDir::cleanPath(QStringLiteral("data/models"))
                                : candidates.first();
}

const ModelManifest& ModelRegistry::manifest() const
{
    return m_manifest;
}

const QString& ModelRegistry::modelsDir() const
{
    return m_modelsDir;
}

} // namespace im
