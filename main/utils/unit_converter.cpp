#include <main/utils/unit_converter.hpp>

namespace UnitConverter {
    float celsiusToFahrenheit(float celsius) {
        return celsius * 1.8f + 32.0f;
    }

    float luxToFootCandle(float lux) {
        return lux / kLuxPerFootCandle;
    }

    float moistureToScale(int raw) {
        return static_cast<float>(raw) / 20.0f;
    }

    PlantMeasurement convert(const SensorReading& reading) {
        PlantMeasurement m{};
        m.sunlight_fc = luxToFootCandle(reading.lux);
        m.moisture_scale = moistureToScale(reading.moisture_raw);
        m.temperature_f = celsiusToFahrenheit(reading.temp_c);
        return m;
    }
}
