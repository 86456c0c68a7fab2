#pragma once

#include <QString>
#include <QStringList>

namespace vq {

// Case-fold and collapse all whitespace runs to single spaces.
// Idempotent: normalizeText(normalizeText(s)) == normalizeText(s).
QString normalizeText(const QString& raw);

// Lower-cased whitespace tokens, in order, duplicates kept.
QStringList tokenize(const QString& text);

} // namespace vq
