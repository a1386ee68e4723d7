#ifndef PLANT_MEASUREMENT_HPP
#define PLANT_MEASUREMENT_HPP

#include <cstdint>

// Raw values taken from the sensors in one cycle
struct SensorReading {
    float     lux;          // ambient light in lux (>= 0)
    uint16_t  moisture_raw; // capacitive reading, ~200 (dry) .. ~2000 (wet)
    float     temp_c;       // soil temperature in Celsius
    uint64_t  ts_ms;        // monotonic time the cycle started
};

// Values in publish units, overwritten every cycle
struct PlantMeasurement {
    float sunlight_fc;    // foot-candles
    float moisture_scale; // ~10..100
    float temperature_f;  // Fahrenheit
};

#endif // PLANT_MEASUREMENT_HPP
