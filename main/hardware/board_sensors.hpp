#ifndef BOARD_SENSORS_HPP
#define BOARD_SENSORS_HPP

#include <main/hardware/plant_sensors.hpp>
#include <main/hardware/seesaw_soil_sensor.hpp>
#include <main/hardware/tsl2591_light_sensor.hpp>

// PlantSensors backed by the soil sensor and the TSL2591 on the I2C bus
class BoardSensors : public PlantSensors {
public:
    BoardSensors(SeesawSoilSensor& soil, Tsl2591LightSensor& light);

    bool readLux(float& out_lux) override;
    bool readMoistureRaw(uint16_t& out_raw) override;
    bool readTemperatureC(float& out_celsius) override;

private:
    SeesawSoilSensor& soil;
    Tsl2591LightSensor& light;
};

#endif // BOARD_SENSORS_HPP
