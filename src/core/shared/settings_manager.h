#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace im {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file, by default at:
//   <GenericConfigLocation>/interestmapper/settings.json
// Keys missing from the file keep their built-in defaults.
class SettingsManager {
public:
    // Load settings from the given path (or the default path when empty).
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<EngineSettings> load(const QString& path = QString());

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const EngineSettings& settings, const QString& path = QString());

    static QString settingsFilePath();

    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace im
