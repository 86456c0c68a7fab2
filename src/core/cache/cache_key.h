#pragma once

#include <QString>

namespace vq {

enum class CacheKind {
    VideoStatus,
    QueryResponse,
};

QString cacheKindToString(CacheKind kind);

// Immutable composite cache key. Query keys carry the normalized query text
// (lower-cased, whitespace-collapsed) and its fingerprint.
class CacheKey {
public:
    static CacheKey videoStatus(const QString& videoId);
    static CacheKey queryResponse(const QString& videoId, const QString& rawQuery);

    // Lowercase hex MD5 of an already-normalized query.
    static QString fingerprintOf(const QString& normalizedQuery);

    CacheKind kind() const { return m_kind; }
    const QString& videoId() const { return m_videoId; }
    const QString& normalizedQuery() const { return m_normalizedQuery; }
    const QString& fingerprint() const { return m_fingerprint; }

    // "video_processed:<video>" or "query:<video>:<fingerprint>"
    const QString& encoded() const { return m_encoded; }

    bool operator==(const CacheKey& other) const { return m_encoded == other.m_encoded; }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    CacheKey(CacheKind kind, QString videoId, QString normalizedQuery);

    CacheKind m_kind;
    QString m_videoId;
    QString m_normalizedQuery;
    QString m_fingerprint;
    QString m_encoded;
};

} // namespace vq
