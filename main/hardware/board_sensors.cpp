#include <main/hardware/board_sensors.hpp>

BoardSensors::BoardSensors(SeesawSoilSensor& soil_in, Tsl2591LightSensor& light_in)
    : soil(soil_in), light(light_in) {}

bool BoardSensors::readLux(float& out_lux) {
    return light.readLux(out_lux);
}

bool BoardSensors::readMoistureRaw(uint16_t& out_raw) {
    return soil.readMoisture(out_raw);
}

bool BoardSensors::readTemperatureC(float& out_celsius) {
    return soil.readTemperature(out_celsius);
}
