#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace dq {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/docqa/settings.json
// DOCQA_SETTINGS overrides that path.
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFrom(const QString& filePath);

    // Save settings. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings);
    static bool saveTo(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultDatabasePath();

    // Missing keys keep their defaults; values are clamped.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace dq
