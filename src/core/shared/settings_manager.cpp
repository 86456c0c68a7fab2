#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace vq {

QString denseFailurePolicyToString(DenseFailurePolicy policy)
{
    switch (policy) {
    case DenseFailurePolicy::DegradeToLexical:
        return QStringLiteral("degrade");
    case DenseFailurePolicy::Fail:
        return QStringLiteral("fail");
    }
    return QStringLiteral("degrade");
}

DenseFailurePolicy denseFailurePolicyFromString(const QString& str)
{
    if (str.compare(QLatin1String("fail"), Qt::CaseInsensitive) == 0) {
        return DenseFailurePolicy::Fail;
    }
    return DenseFailurePolicy::DegradeToLexical;
}

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vqCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vqCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vqCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(vqCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(vqCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/vidqa/settings.json");
}

QString SettingsManager::defaultCacheDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/vidqa/cache");
}

Settings SettingsManager::defaults()
{
    Settings settings;
    settings.cacheDir = defaultCacheDir();
    return settings;
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("cacheDir"), settings.cacheDir);
    json.insert(QStringLiteral("cacheTtlSeconds"), static_cast<qint64>(settings.cacheTtlSeconds));
    json.insert(QStringLiteral("memoryCacheMaxEntries"), settings.memoryCacheMaxEntries);
    json.insert(QStringLiteral("similarityThreshold"), settings.similarityThreshold);
    json.insert(QStringLiteral("defaultTopK"), settings.defaultTopK);
    json.insert(QStringLiteral("summaryTopK"), settings.summaryTopK);
    json.insert(QStringLiteral("hybridVectorWeight"), settings.hybridVectorWeight);
    json.insert(QStringLiteral("denseFailurePolicy"),
                denseFailurePolicyToString(settings.denseFailurePolicy));
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings = defaults();

    settings.cacheDir = json.value(QStringLiteral("cacheDir")).toString(settings.cacheDir);

    if (json.contains(QStringLiteral("cacheTtlSeconds"))) {
        const int64_t ttl = static_cast<int64_t>(
            json.value(QStringLiteral("cacheTtlSeconds")).toVariant().toLongLong());
        if (ttl > 0) {
            settings.cacheTtlSeconds = ttl;
        } else {
            LOG_WARN(vqCore, "Ignoring non-positive cacheTtlSeconds %lld",
                     static_cast<long long>(ttl));
        }
    }

    if (json.contains(QStringLiteral("memoryCacheMaxEntries"))) {
        settings.memoryCacheMaxEntries = std::max(
            1, json.value(QStringLiteral("memoryCacheMaxEntries")).toInt(settings.memoryCacheMaxEntries));
    }

    settings.similarityThreshold = json.value(QStringLiteral("similarityThreshold"))
                                       .toDouble(settings.similarityThreshold);

    if (json.contains(QStringLiteral("defaultTopK"))) {
        settings.defaultTopK = std::max(
            1, json.value(QStringLiteral("defaultTopK")).toInt(settings.defaultTopK));
    }

    if (json.contains(QStringLiteral("summaryTopK"))) {
        settings.summaryTopK = std::max(
            1, json.value(QStringLiteral("summaryTopK")).toInt(settings.summaryTopK));
    }

    settings.hybridVectorWeight = std::clamp(
        json.value(QStringLiteral("hybridVectorWeight")).toDouble(settings.hybridVectorWeight),
        0.0, 1.0);

    if (json.contains(QStringLiteral("denseFailurePolicy"))) {
        settings.denseFailurePolicy = denseFailurePolicyFromString(
            json.value(QStringLiteral("denseFailurePolicy")).toString());
    }

    return settings;
}

} // namespace vq
