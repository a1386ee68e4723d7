#ifndef TELEMETRY_CHANNEL_HPP
#define TELEMETRY_CHANNEL_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/plant_measurement.hpp>

enum class TelemetryChannel : uint8_t {
    SUNLIGHT = 0,
    MOISTURE = 1,
    TEMPERATURE = 2
};

struct ChannelInfo {
    TelemetryChannel channel;
    const char* key;   // measurement key
    const char* feed;  // broker feed the value is published to
    const char* label; // human-readable name for logs
    const char* unit;
};

// Publish order is the array order.
static constexpr ChannelInfo kTelemetryChannels[] = {
    { TelemetryChannel::SUNLIGHT,    "sunlight",    "sun",                "Sunlight",    "Ft-Candles" },
    { TelemetryChannel::MOISTURE,    "moisture",    "spruce.moisture",    "Moisture",    "Humidity" },
    { TelemetryChannel::TEMPERATURE, "temperature", "spruce.temperature", "Temperature", "F" },
};

static constexpr std::size_t kTelemetryChannelCount =
    sizeof(kTelemetryChannels) / sizeof(kTelemetryChannels[0]);

inline float channelValue(const PlantMeasurement& m, TelemetryChannel channel) {
    switch (channel) {
        case TelemetryChannel::SUNLIGHT:    return m.sunlight_fc;
        case TelemetryChannel::MOISTURE:    return m.moisture_scale;
        case TelemetryChannel::TEMPERATURE: return m.temperature_f;
    }
    return 0.0f;
}

#endif // TELEMETRY_CHANNEL_HPP
