#ifndef PLANT_SENSORS_HPP
#define PLANT_SENSORS_HPP

#include <cstdint>

// The three raw readings the sampling loop needs. Each call is one blocking
// bus transaction; false means the driver could not produce a value.
class PlantSensors {
public:
    virtual ~PlantSensors() = default;

    virtual bool readLux(float& out_lux) = 0;
    virtual bool readMoistureRaw(uint16_t& out_raw) = 0;
    virtual bool readTemperatureC(float& out_celsius) = 0;
};

#endif // PLANT_SENSORS_HPP
