#pragma once

#include <cstdint>

namespace vq {

// Wall-clock source for TTL decisions. Injected everywhere an entry age is
// computed so tests can advance time explicitly.
class TimeSource {
public:
    virtual ~TimeSource() = default;

    // Milliseconds since the Unix epoch.
    virtual int64_t nowMs() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    int64_t nowMs() const override;

    // Process-wide default instance.
    static SystemTimeSource& instance();
};

} // namespace vq
