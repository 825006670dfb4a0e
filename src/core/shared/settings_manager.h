#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace nv {

// SettingsManager -- JSON save/load for engine settings.
//
// The default location is:
//   <GenericDataLocation>/notevault/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed. Relative paths resolve against the file's
    // directory; ":memory:" is kept as is.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings to disk, creating the parent directory if needed.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    // Extensions come back lowercase with one leading dot, deduplicated.
    static Settings fromJson(const QJsonObject& json);
};

} // namespace nv
