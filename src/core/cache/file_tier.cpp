#include "core/cache/file_tier.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QUrl>

#include <cmath>
#include <utility>

namespace vq {

namespace {

constexpr int kFingerprintHexLength = 32;

enum class ReadStatus {
    Ok,
    Missing,
    Unreadable,
    Malformed,
};

ReadStatus readJsonObject(const QString& filePath, QJsonObject& out)
{
    QFile file(filePath);
    if (!file.exists()) {
        return ReadStatus::Missing;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return ReadStatus::Unreadable;
    }

    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return ReadStatus::Malformed;
    }
    out = doc.object();
    return ReadStatus::Ok;
}

// Timestamps are stored as epoch seconds with a fractional part.
double toEpochSeconds(int64_t ms)
{
    return static_cast<double>(ms) / 1000.0;
}

std::optional<int64_t> timestampMs(const QJsonObject& json)
{
    const QJsonValue value = json.value(QStringLiteral("timestamp"));
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(std::llround(value.toDouble() * 1000.0));
}

} // namespace

FileTier::FileTier(QString rootDir)
    : m_rootDir(std::move(rootDir))
{
}

bool FileTier::initialize()
{
    for (const QString& dir : {videosDir(), queriesDir()}) {
        if (!QDir().mkpath(dir)) {
            LOG_ERROR(vqCache, "Failed to create cache directory: %s", qUtf8Printable(dir));
            return false;
        }
    }
    return true;
}

QString FileTier::videosDir() const
{
    return m_rootDir + QStringLiteral("/videos");
}

QString FileTier::queriesDir() const
{
    return m_rootDir + QStringLiteral("/queries");
}

QString FileTier::encodeVideoId(const QString& videoId)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(videoId));
}

QString FileTier::videoFilePath(const QString& videoId) const
{
    return videosDir() + QLatin1Char('/') + encodeVideoId(videoId) + QStringLiteral(".json");
}

QString FileTier::queryFilePath(const QString& videoId, const QString& fingerprint) const
{
    return queriesDir() + QLatin1Char('/') + encodeVideoId(videoId) + QLatin1Char('_')
        + fingerprint + QStringLiteral(".json");
}

QJsonObject FileTier::videoRecordToJson(const CacheEntry& entry)
{
    QJsonObject json;
    json.insert(QStringLiteral("video_id"), entry.key.videoId());
    json.insert(QStringLiteral("timestamp"), toEpochSeconds(entry.createdAtMs));
    json.insert(QStringLiteral("processed"), entry.processed);
    return json;
}

QJsonObject FileTier::queryRecordToJson(const QueryRecord& record)
{
    QJsonObject json;
    json.insert(QStringLiteral("video_id"), record.videoId);
    json.insert(QStringLiteral("query"), record.normalizedQuery);
    json.insert(QStringLiteral("response"), record.response);
    json.insert(QStringLiteral("timestamp"), toEpochSeconds(record.createdAtMs));
    return json;
}

std::optional<int64_t> FileTier::parseVideoRecord(const QJsonObject& json, const QString& videoId)
{
    if (json.value(QStringLiteral("video_id")).toString() != videoId
        || !json.value(QStringLiteral("processed")).isBool()) {
        return std::nullopt;
    }
    return timestampMs(json);
}

std::optional<QueryRecord> FileTier::parseQueryRecord(const QJsonObject& json)
{
    const QJsonValue videoId = json.value(QStringLiteral("video_id"));
    const QJsonValue query = json.value(QStringLiteral("query"));
    const QJsonValue response = json.value(QStringLiteral("response"));
    const std::optional<int64_t> createdAt = timestampMs(json);
    if (!videoId.isString() || !query.isString() || !response.isString() || !createdAt) {
        return std::nullopt;
    }

    QueryRecord record;
    record.videoId = videoId.toString();
    record.normalizedQuery = query.toString();
    record.response = response.toString();
    record.createdAtMs = *createdAt;
    return record;
}

TierLookup FileTier::get(const CacheKey& key)
{
    const bool isVideo = key.kind() == CacheKind::VideoStatus;
    const QString filePath = isVideo ? videoFilePath(key.videoId())
                                     : queryFilePath(key.videoId(), key.fingerprint());

    QJsonObject json;
    switch (readJsonObject(filePath, json)) {
    case ReadStatus::Missing:
        return TierLookup::miss();
    case ReadStatus::Unreadable:
        return TierLookup::failure(QStringLiteral("cannot open %1").arg(filePath));
    case ReadStatus::Malformed:
        return TierLookup::failure(QStringLiteral("malformed record %1").arg(filePath));
    case ReadStatus::Ok:
        break;
    }

    if (isVideo) {
        const std::optional<int64_t> createdAt = parseVideoRecord(json, key.videoId());
        if (!createdAt) {
            return TierLookup::failure(QStringLiteral("malformed record %1").arg(filePath));
        }
        if (!json.value(QStringLiteral("processed")).toBool()) {
            return TierLookup::miss();
        }
        CacheEntry entry = CacheEntry::forVideoStatus(key.videoId(), *createdAt);
        entry.tierOfOrigin = TierKind::File;
        return TierLookup::hit(std::move(entry));
    }

    const std::optional<QueryRecord> record = parseQueryRecord(json);
    if (!record) {
        return TierLookup::failure(QStringLiteral("malformed record %1").arg(filePath));
    }
    if (record->videoId != key.videoId() || record->normalizedQuery != key.normalizedQuery()) {
        return TierLookup::miss();
    }

    CacheEntry entry = CacheEntry::forResponse(key, record->response, record->createdAtMs);
    entry.tierOfOrigin = TierKind::File;
    return TierLookup::hit(std::move(entry));
}

bool FileTier::set(const CacheEntry& entry)
{
    if (entry.key.kind() == CacheKind::VideoStatus) {
        return writeJson(videoFilePath(entry.key.videoId()), videoRecordToJson(entry));
    }

    QueryRecord record;
    record.videoId = entry.key.videoId();
    record.normalizedQuery = entry.key.normalizedQuery();
    record.response = entry.response;
    record.createdAtMs = entry.createdAtMs;
    return writeJson(queryFilePath(record.videoId, entry.key.fingerprint()),
                     queryRecordToJson(record));
}

bool FileTier::exists(const CacheKey& key)
{
    const QString filePath = key.kind() == CacheKind::VideoStatus
        ? videoFilePath(key.videoId())
        : queryFilePath(key.videoId(), key.fingerprint());
    return QFileInfo::exists(filePath);
}

bool FileTier::writeJson(const QString& filePath, const QJsonObject& json)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(vqCache, "Failed to open cache record for write: %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }

    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (file.write(payload) != payload.size()) {
        LOG_ERROR(vqCache, "Failed to write cache record: %s", qUtf8Printable(filePath));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        LOG_ERROR(vqCache, "Failed to commit cache record: %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

std::optional<QueryHistoryScan> FileTier::queryHistory(const QString& videoId)
{
    QDir dir(queriesDir());
    if (!dir.exists()) {
        LOG_WARN(vqCache, "Query history directory missing: %s", qUtf8Printable(dir.path()));
        return std::nullopt;
    }

    const QString prefix = encodeVideoId(videoId) + QLatin1Char('_');
    const QStringList files = dir.entryList(
        QStringList{prefix + QStringLiteral("*.json")}, QDir::Files, QDir::Name);

    // "<prefix><32 hex>.json": reject names belonging to a longer video id
    // that merely shares this prefix.
    const int expectedLength = prefix.size() + kFingerprintHexLength + 5;

    QueryHistoryScan scan;
    for (const QString& fileName : files) {
        if (fileName.size() != expectedLength) {
            continue;
        }

        QJsonObject json;
        const QString filePath = dir.filePath(fileName);
        const ReadStatus status = readJsonObject(filePath, json);
        if (status == ReadStatus::Missing) {
            continue;  // removed between listing and reading
        }
        if (status != ReadStatus::Ok) {
            LOG_WARN(vqCache, "Skipping unreadable query record: %s", qUtf8Printable(filePath));
            ++scan.unreadable;
            continue;
        }

        std::optional<QueryRecord> record = parseQueryRecord(json);
        if (!record) {
            LOG_WARN(vqCache, "Skipping malformed query record: %s", qUtf8Printable(filePath));
            ++scan.unreadable;
            continue;
        }
        if (record->videoId != videoId) {
            continue;
        }
        scan.records.push_back(std::move(*record));
    }

    return scan;
}

} // namespace vq
