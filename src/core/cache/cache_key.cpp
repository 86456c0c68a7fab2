#include "core/cache/cache_key.h"
#include "core/shared/text_tokens.h"

#include <QCryptographicHash>

#include <utility>

namespace vq {

QString cacheKindToString(CacheKind kind)
{
    switch (kind) {
    case CacheKind::VideoStatus:
        return QStringLiteral("video-status");
    case CacheKind::QueryResponse:
        return QStringLiteral("query-response");
    }
    return QStringLiteral("video-status");
}

CacheKey::CacheKey(CacheKind kind, QString videoId, QString normalizedQuery)
    : m_kind(kind)
    , m_videoId(std::move(videoId))
    , m_normalizedQuery(std::move(normalizedQuery))
{
    if (m_kind == CacheKind::QueryResponse) {
        m_fingerprint = fingerprintOf(m_normalizedQuery);
        m_encoded = QStringLiteral("query:%1:%2").arg(m_videoId, m_fingerprint);
    } else {
        m_encoded = QStringLiteral("video_processed:%1").arg(m_videoId);
    }
}

CacheKey CacheKey::videoStatus(const QString& videoId)
{
    return CacheKey(CacheKind::VideoStatus, videoId, QString());
}

CacheKey CacheKey::queryResponse(const QString& videoId, const QString& rawQuery)
{
    return CacheKey(CacheKind::QueryResponse, videoId, normalizeText(rawQuery));
}

QString CacheKey::fingerprintOf(const QString& normalizedQuery)
{
    const QByteArray hash = QCryptographicHash::hash(
        normalizedQuery.toUtf8(), QCryptographicHash::Md5);
    return QString::fromLatin1(hash.toHex());
}

} // namespace vq
