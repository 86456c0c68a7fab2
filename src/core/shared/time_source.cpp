#include "core/shared/time_source.h"

#include <QDateTime>

namespace vq {

int64_t SystemTimeSource::nowMs() const
{
    return QDateTime::currentMSecsSinceEpoch();
}

SystemTimeSource& SystemTimeSource::instance()
{
    static SystemTimeSource source;
    return source;
}

} // namespace vq
