#pragma once

#include "core/cache/cache_tier.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace vq {

// FileTier -- durable flat-file tier, one self-describing JSON file per
// entity:
//   <root>/videos/<video>.json              {video_id, timestamp, processed}
//   <root>/queries/<video>_<fingerprint>.json {video_id, query, response, timestamp}
// Video ids are percent-encoded in file names. Writes go through QSaveFile
// (temp file + rename) so a reader never sees a half-written record.
class FileTier : public CacheTier, public QueryHistory {
public:
    explicit FileTier(QString rootDir);

    // Create the directory layout. Returns false if it cannot be created.
    bool initialize();

    TierKind kind() const override { return TierKind::File; }
    TierLookup get(const CacheKey& key) override;
    bool set(const CacheEntry& entry) override;
    bool exists(const CacheKey& key) override;

    std::optional<QueryHistoryScan> queryHistory(const QString& videoId) override;

    const QString& rootDir() const { return m_rootDir; }
    QString videosDir() const;
    QString queriesDir() const;
    QString videoFilePath(const QString& videoId) const;
    QString queryFilePath(const QString& videoId, const QString& fingerprint) const;

    static QString encodeVideoId(const QString& videoId);

    // Record (de)serialization. Parse functions return nullopt for
    // malformed records.
    static QJsonObject videoRecordToJson(const CacheEntry& entry);
    static QJsonObject queryRecordToJson(const QueryRecord& record);
    static std::optional<int64_t> parseVideoRecord(const QJsonObject& json, const QString& videoId);
    static std::optional<QueryRecord> parseQueryRecord(const QJsonObject& json);

private:
    bool writeJson(const QString& filePath, const QJsonObject& json);

    QString m_rootDir;
};

} // namespace vq
