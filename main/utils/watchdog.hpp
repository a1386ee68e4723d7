#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <cstdint>

// Task watchdog guarding the sampling loop. A hung bus transaction or a
// stalled reconnect panics and reboots the device once the timeout passes.
class LoopWatchdog {
public:
    explicit LoopWatchdog(uint32_t timeout_ms);

    // Reconfigure the TWDT and subscribe the calling task.
    bool start();
    void feed();

    bool isRunning() const { return running; }

private:
    uint32_t timeout_ms;
    bool running;
};

#endif // WATCHDOG_HPP
