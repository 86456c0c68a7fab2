#pragma once

#include <QJsonObject>
#include <QString>

namespace vq {

// One indexed transcript segment. Produced by the transcript indexer,
// referenced (never owned authoritatively) by retrieval.
struct Passage {
    QString id;
    QString text;
    QJsonObject metadata;   // e.g. {"chunk_id": 3, "video_id": "...", "source": "transcript"}
};

// Stable passage id: SHA-256 of "videoId#chunkIndex"
QString computePassageId(const QString& videoId, int chunkIndex);

} // namespace vq
