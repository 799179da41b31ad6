#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace vl {

std::optional<Settings> SettingsManager::load(const QString& filePath,
                                              const QString& fallbackDataDir)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vlCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vlCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    Settings settings = fromJson(doc.object());
    if (settings.dataDir.isEmpty()) {
        settings.dataDir = fallbackDataDir;
    }
    return resolved(settings);
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vlCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(vlCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0 || !file.commit()) {
        LOG_ERROR(vlCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

Settings SettingsManager::defaults(const QString& dataDir)
{
    Settings settings;
    settings.dataDir = dataDir;
    return resolved(settings);
}

Settings SettingsManager::resolved(Settings settings)
{
    if (settings.dataDir.isEmpty()) {
        settings.dataDir = defaultDataDir();
    }
    const QDir dir(settings.dataDir);
    if (settings.catalogPath.isEmpty()) {
        settings.catalogPath = dir.filePath(QStringLiteral("image_data.json"));
    }
    if (settings.tagPath.isEmpty()) {
        settings.tagPath = dir.filePath(QStringLiteral("tags.json"));
    }
    if (settings.defaultTopK <= 0) {
        settings.defaultTopK = 10;
    }
    if (settings.indexCommitBatch < 0) {
        settings.indexCommitBatch = 0;
    }
    if (settings.embeddingDimensions < 0) {
        settings.embeddingDimensions = 0;
    }
    return settings;
}

QString SettingsManager::settingsFilePath()
{
    return QDir(defaultDataDir()).filePath(QStringLiteral("settings.json"));
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/visualoom");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("catalogPath"), settings.catalogPath);
    json.insert(QStringLiteral("tagPath"), settings.tagPath);
    json.insert(QStringLiteral("defaultTopK"), settings.defaultTopK);
    json.insert(QStringLiteral("indexCommitBatch"), settings.indexCommitBatch);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.catalogPath = json.value(QStringLiteral("catalogPath")).toString(settings.catalogPath);
    settings.tagPath = json.value(QStringLiteral("tagPath")).toString(settings.tagPath);
    settings.defaultTopK = json.value(QStringLiteral("defaultTopK")).toInt(settings.defaultTopK);
    settings.indexCommitBatch =
        json.value(QStringLiteral("indexCommitBatch")).toInt(settings.indexCommitBatch);
    settings.embeddingDimensions =
        json.value(QStringLiteral("embeddingDimensions")).toInt(settings.embeddingDimensions);

    return settings;
}

} // namespace vl
