#include <main/tasks/sampling_loop.hpp>
#include <main/models/telemetry_channel.hpp>
#include <main/utils/unit_converter.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "SAMPLING";

SamplingLoop::SamplingLoop(PlantSensors& sensors_in,
                           TelemetrySession& session_in,
                           const MonotonicClock& clock_in,
                           const Settings& settings_in)
    : sensors(sensors_in),
      session(session_in),
      clock(clock_in),
      settings(settings_in),
      current_state(State::IDLE),
      has_last_updated(false),
      last_updated_ms(0),
      measurement{} {}

bool SamplingLoop::intervalElapsed(uint64_t now_ms) const {
    // First poll after boot always samples
    if (!has_last_updated) {
        return true;
    }
    return (now_ms - last_updated_ms) >= settings.interval_ms;
}

SamplingLoop::PollResult SamplingLoop::poll() {
    session.service();

    const uint64_t now_ms = clock.nowMs();
    if (!intervalElapsed(now_ms)) {
        return PollResult::IDLE;
    }

    current_state = State::CYCLE;
    PollResult result = runCycle(now_ms);
    current_state = State::IDLE;
    return result;
}

SamplingLoop::PollResult SamplingLoop::handleSensorFailure(const char* what, uint64_t cycle_start_ms) {
    if (settings.sensor_failure_policy == SensorFailurePolicy::SKIP_CYCLE) {
        LOG_WARN(TAG, "%s read failed; skipping this cycle", what);
        last_updated_ms = cycle_start_ms;
        has_last_updated = true;
        return PollResult::SENSOR_SKIPPED;
    }
    LOG_ERROR(TAG, "%s read failed", what);
    return PollResult::SENSOR_FATAL;
}

SamplingLoop::PollResult SamplingLoop::runCycle(uint64_t cycle_start_ms) {
    LOG_INFO(TAG, "%s", "Taking measurements...");

    SensorReading reading{};
    reading.ts_ms = cycle_start_ms;
    if (!sensors.readLux(reading.lux)) {
        return handleSensorFailure("Light sensor", cycle_start_ms);
    }
    if (!sensors.readMoistureRaw(reading.moisture_raw)) {
        return handleSensorFailure("Soil moisture", cycle_start_ms);
    }
    if (!sensors.readTemperatureC(reading.temp_c)) {
        return handleSensorFailure("Soil temperature", cycle_start_ms);
    }

    measurement = UnitConverter::convert(reading);
    for (const ChannelInfo& info : kTelemetryChannels) {
        LOG_INFO(TAG, "%s: %.2f %s", info.label,
                 static_cast<double>(channelValue(measurement, info.channel)), info.unit);
    }

    LOG_INFO(TAG, "%s", "Sending data...");
    for (const ChannelInfo& info : kTelemetryChannels) {
        if (!session.publish(info.feed, channelValue(measurement, info.channel))) {
            // Remaining channels of this cycle are dropped; the next poll retries the whole cycle
            LOG_ERROR(TAG, "Failed to post %s, resetting network and retrying...", info.feed);
            if (!session.reset()) {
                LOG_ERROR(TAG, "%s", "Network reset failed");
            }
            return PollResult::PUBLISH_FAILED;
        }
    }

    last_updated_ms = cycle_start_ms;
    has_last_updated = true;
    LOG_INFO(TAG, "%s", "Measurement data sent!");
    return PollResult::PUBLISHED;
}
