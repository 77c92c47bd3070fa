#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace rb {

namespace {

int intValue(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (!value.isDouble()) {
        return fallback;
    }
    return value.toInt(fallback);
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rbCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rbCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rbCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rbCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rbCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("RUNBAR_SETTINGS");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    return dataDirectory() + QStringLiteral("/settings.json");
}

QString SettingsManager::dataDirectory()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/runbar");
}

Settings SettingsManager::resolved(Settings settings)
{
    if (settings.catalogPath.isEmpty()) {
        settings.catalogPath = dataDirectory() + QStringLiteral("/catalog.json");
    }
    if (settings.historyDbPath.isEmpty()) {
        settings.historyDbPath = dataDirectory() + QStringLiteral("/history.db");
    }

    settings.historyMaxEntries = std::max(1, settings.historyMaxEntries);
    settings.recentLimit = std::max(0, settings.recentLimit);
    settings.historyMatchLimit = std::max(1, settings.historyMatchLimit);
    settings.programResultLimit = std::max(1, settings.programResultLimit);
    settings.directoryListingLimit = std::max(0, settings.directoryListingLimit);
    settings.providerWorkers = std::max(1, settings.providerWorkers);
    settings.providerTimeoutMs = std::max(0, settings.providerTimeoutMs);
    settings.debounceMs = std::max(0, settings.debounceMs);
    return settings;
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("catalogPath"), settings.catalogPath);
    json.insert(QStringLiteral("historyDbPath"), settings.historyDbPath);
    json.insert(QStringLiteral("historyMaxEntries"), settings.historyMaxEntries);
    json.insert(QStringLiteral("recentLimit"), settings.recentLimit);
    json.insert(QStringLiteral("historyMatchLimit"), settings.historyMatchLimit);
    json.insert(QStringLiteral("programResultLimit"), settings.programResultLimit);
    json.insert(QStringLiteral("directoryListingLimit"), settings.directoryListingLimit);
    json.insert(QStringLiteral("applicationDirs"), QJsonArray::fromStringList(settings.applicationDirs));
    json.insert(QStringLiteral("providerWorkers"), settings.providerWorkers);
    json.insert(QStringLiteral("providerTimeoutMs"), settings.providerTimeoutMs);
    json.insert(QStringLiteral("debounceMs"), settings.debounceMs);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.catalogPath = json.value(QStringLiteral("catalogPath")).toString(settings.catalogPath);
    settings.historyDbPath = json.value(QStringLiteral("historyDbPath")).toString(settings.historyDbPath);

    settings.historyMaxEntries = intValue(json, "historyMaxEntries", settings.historyMaxEntries);
    settings.recentLimit = intValue(json, "recentLimit", settings.recentLimit);
    settings.historyMatchLimit = intValue(json, "historyMatchLimit", settings.historyMatchLimit);
    settings.programResultLimit = intValue(json, "programResultLimit", settings.programResultLimit);
    settings.directoryListingLimit = intValue(json, "directoryListingLimit",
                                              settings.directoryListingLimit);

    const QJsonArray dirsArray = json.value(QStringLiteral("applicationDirs")).toArray();
    settings.applicationDirs.reserve(dirsArray.size());
    for (const QJsonValue& value : dirsArray) {
        if (value.isString() && !value.toString().isEmpty()) {
            settings.applicationDirs.append(value.toString());
        }
    }

    settings.providerWorkers = intValue(json, "providerWorkers", settings.providerWorkers);
    settings.providerTimeoutMs = intValue(json, "providerTimeoutMs", settings.providerTimeoutMs);
    settings.debounceMs = intValue(json, "debounceMs", settings.debounceMs);

    return settings;
}

} // namespace rb
