#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace vanta {

// SettingsManager -- JSON save/load for launcher settings.
//
// Settings are stored as a JSON file at:
//   <config dir>/config.json   (see Paths::configDir)
class SettingsManager {
public:
    // Load settings from the given file. Returns nullopt if the file doesn't
    // exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Load settings, writing a default file when none exists. A malformed
    // file is left untouched and defaults are returned.
    static Settings loadOrCreateDefault(const QString& filePath = settingsFilePath());

    // Save settings. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace vanta
