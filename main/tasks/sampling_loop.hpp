#ifndef SAMPLING_LOOP_HPP
#define SAMPLING_LOOP_HPP

#include <cstdint>
#include <main/hardware/plant_sensors.hpp>
#include <main/network/telemetry_session.hpp>
#include <main/utils/monotonic_clock.hpp>
#include <main/models/plant_measurement.hpp>

// What to do when a sensor read fails during a cycle
enum class SensorFailurePolicy : uint8_t {
    HALT = 0,       // report fatal; caller restarts the device
    SKIP_CYCLE = 1  // log, publish nothing, wait a full interval
};

// Fixed-interval sense-convert-publish orchestrator. Never sleeps; the owner
// calls poll() repeatedly from a single task.
class SamplingLoop {
public:
    enum class State : uint8_t { IDLE = 0, CYCLE = 1 };

    enum class PollResult : uint8_t {
        IDLE = 0,           // interval not yet elapsed
        PUBLISHED = 1,      // all channels sent, timestamp advanced
        PUBLISH_FAILED = 2, // session reset, cycle abandoned, timestamp kept
        SENSOR_SKIPPED = 3, // read failed under SKIP_CYCLE
        SENSOR_FATAL = 4    // read failed under HALT
    };

    struct Settings {
        uint32_t interval_ms;
        SensorFailurePolicy sensor_failure_policy;
    };

    SamplingLoop(PlantSensors& sensors,
                 TelemetrySession& session,
                 const MonotonicClock& clock,
                 const Settings& settings);

    PollResult poll();

    State state() const { return current_state; }
    bool hasCompletedCycle() const { return has_last_updated; }
    uint64_t lastUpdatedMs() const { return last_updated_ms; }
    const PlantMeasurement& lastMeasurement() const { return measurement; }

private:
    bool intervalElapsed(uint64_t now_ms) const;
    PollResult runCycle(uint64_t cycle_start_ms);
    PollResult handleSensorFailure(const char* what, uint64_t cycle_start_ms);

    PlantSensors& sensors;
    TelemetrySession& session;
    const MonotonicClock& clock;
    Settings settings;

    State current_state;
    bool has_last_updated;
    uint64_t last_updated_ms;
    PlantMeasurement measurement;
};

#endif // SAMPLING_LOOP_HPP
