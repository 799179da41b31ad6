#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace vl {

// SettingsManager -- JSON save/load for application settings.
//
// Settings are stored as a JSON file at:
//   <AppDataLocation>/visualoom/settings.json
// unless an explicit path is given.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed. A file without dataDir is rooted at
    // fallbackDataDir, or the standard data location when that is empty.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath(),
                                        const QString& fallbackDataDir = QString());

    // Save settings to disk atomically. Creates the directory if it doesn't
    // exist. Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    // Defaults rooted at dataDir (or the standard data location when empty).
    static Settings defaults(const QString& dataDir = QString());

    // Fill empty storage paths from dataDir.
    static Settings resolved(Settings settings);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();
    static QString defaultDataDir();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace vl
