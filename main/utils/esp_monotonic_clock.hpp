#ifndef ESP_MONOTONIC_CLOCK_HPP
#define ESP_MONOTONIC_CLOCK_HPP

#include <main/utils/monotonic_clock.hpp>

// Backed by esp_timer (64-bit microseconds since boot)
class EspMonotonicClock : public MonotonicClock {
public:
    uint64_t nowMs() const override;
};

#endif // ESP_MONOTONIC_CLOCK_HPP
