#include "core/shared/passage.h"
#include <QCryptographicHash>

namespace vq {

QString computePassageId(const QString& videoId, int chunkIndex)
{
    const QString seed = videoId + QStringLiteral("#") + QString::number(chunkIndex);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace vq
