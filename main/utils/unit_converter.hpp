#ifndef UNIT_CONVERTER_HPP
#define UNIT_CONVERTER_HPP

#include <cstdint>
#include <main/models/plant_measurement.hpp>

// Pure conversions from sensor units to publish units.
namespace UnitConverter {
    // Lux per foot-candle
    static constexpr float kLuxPerFootCandle = 10.764f;

    float celsiusToFahrenheit(float celsius);
    float luxToFootCandle(float lux);

    // Maps the soil sensor's 200..2000 range onto ~10..100. Not clamped.
    float moistureToScale(int raw);

    PlantMeasurement convert(const SensorReading& reading);
}

#endif // UNIT_CONVERTER_HPP
