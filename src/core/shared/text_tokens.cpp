#include "core/shared/text_tokens.h"

namespace vq {

QString normalizeText(const QString& raw)
{
    return raw.simplified().toLower();
}

QStringList tokenize(const QString& text)
{
    return normalizeText(text).split(QLatin1Char(' '), Qt::SkipEmptyParts);
}

} // namespace vq
