#ifndef MONOTONIC_CLOCK_HPP
#define MONOTONIC_CLOCK_HPP

#include <cstdint>

// Milliseconds since boot; never goes backwards.
class MonotonicClock {
public:
    virtual ~MonotonicClock() = default;
    virtual uint64_t nowMs() const = 0;
};

#endif // MONOTONIC_CLOCK_HPP
