#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace nv {

namespace {

constexpr const char* kInMemoryDb = ":memory:";

std::optional<QJsonObject> readSettingsObject(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(nvCore, "Settings %s unreadable: %s", qUtf8Printable(filePath),
                 qUtf8Printable(file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(nvCore, "Settings %s: %s at offset %d", qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()), parseError.offset);
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(nvCore, "Settings %s: top level is not an object", qUtf8Printable(filePath));
        return std::nullopt;
    }
    return doc.object();
}

// Relative entries are taken relative to the settings file itself.
QString resolveAgainst(const QDir& base, const QString& path)
{
    if (path.isEmpty() || path == QLatin1String(kInMemoryDb) || QDir::isAbsolutePath(path)) {
        return path;
    }
    return QDir::cleanPath(base.absoluteFilePath(path));
}

// ".MD", "md" and " .md " all become ".md".
QString normalizeExtension(const QString& extension)
{
    QString normalized = extension.trimmed().toLower();
    while (normalized.startsWith(QLatin1Char('.'))) {
        normalized.remove(0, 1);
    }
    if (normalized.isEmpty()) {
        return {};
    }
    return QLatin1Char('.') + normalized;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    const std::optional<QJsonObject> json = readSettingsObject(filePath);
    if (!json) {
        return std::nullopt;
    }

    Settings settings = fromJson(*json);
    const QDir base = QFileInfo(filePath).absoluteDir();
    settings.dbPath = resolveAgainst(base, settings.dbPath);
    settings.notesDirectory = resolveAgainst(base, settings.notesDirectory);
    settings.modelsDir = resolveAgainst(base, settings.modelsDir);
    return settings;
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(nvCore, "Cannot create settings directory %s", qUtf8Printable(parentDir));
        return false;
    }

    // Readers never observe a half-written file.
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(nvCore, "Cannot write settings %s: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    const QByteArray payload = QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        LOG_ERROR(nvCore, "Cannot write settings %s: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

QString SettingsManager::settingsFilePath()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation))
        .filePath(QStringLiteral("notevault/settings.json"));
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("notesDirectory"), settings.notesDirectory);
    json.insert(QStringLiteral("fileExtensions"), QJsonArray::fromStringList(settings.fileExtensions));
    json.insert(QStringLiteral("embeddingModelId"), settings.embeddingModelId);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);
    json.insert(QStringLiteral("searchLimit"), settings.searchLimit);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.notesDirectory = json.value(QStringLiteral("notesDirectory"))
                                  .toString(settings.notesDirectory);
    settings.embeddingModelId = json.value(QStringLiteral("embeddingModelId"))
                                    .toString(settings.embeddingModelId);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);

    const QJsonValue extensions = json.value(QStringLiteral("fileExtensions"));
    if (extensions.isArray()) {
        QStringList parsed;
        for (const QJsonValue& value : extensions.toArray()) {
            const QString extension = normalizeExtension(value.toString());
            if (!extension.isEmpty() && !parsed.contains(extension)) {
                parsed.append(extension);
            }
        }
        settings.fileExtensions = parsed;
    } else if (!extensions.isUndefined()) {
        LOG_WARN(nvCore, "Ignoring non-array fileExtensions in settings");
    }

    const int searchLimit = json.value(QStringLiteral("searchLimit")).toInt(settings.searchLimit);
    if (searchLimit > 0) {
        settings.searchLimit = searchLimit;
    } else {
        LOG_WARN(nvCore, "Ignoring non-positive searchLimit in settings: %d", searchLimit);
    }

    return settings;
}

} // namespace nv
