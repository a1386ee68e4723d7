#include <main/utils/esp_monotonic_clock.hpp>
#include <esp_timer.h>

uint64_t EspMonotonicClock::nowMs() const {
    return static_cast<uint64_t>(esp_timer_get_time() / 1000LL);
}
