#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rb {

// SettingsManager -- JSON save/load for launcher settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/runbar/settings.json
// RUNBAR_SETTINGS overrides the location.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    static QString settingsFilePath();
    static QString dataDirectory();

    // Fills empty data file paths and clamps out-of-range numbers.
    static Settings resolved(Settings settings);

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace rb
