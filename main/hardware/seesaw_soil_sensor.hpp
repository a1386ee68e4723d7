#ifndef SEESAW_SOIL_SENSOR_HPP
#define SEESAW_SOIL_SENSOR_HPP

#include <cstdint>
#include <main/hardware/i2c_bus.hpp>

// Adafruit STEMMA capacitive soil sensor (seesaw firmware on SAMD09/ATtiny).
// Moisture comes from capacitive touch channel 0, temperature from the
// chip's internal sensor.
class SeesawSoilSensor {
public:
    SeesawSoilSensor(I2cBus& bus, uint8_t addr_7bit);

    // Software reset, then verify the hardware ID
    bool init();

    // Raw capacitance, ~200 (dry) .. ~2000 (wet)
    bool readMoisture(uint16_t& out_raw);

    bool readTemperature(float& out_celsius);

private:
    bool readRegister(uint8_t module, uint8_t function, uint8_t* out, size_t len, uint32_t delay_ms);

    I2cBus& bus;
    uint8_t addr;
    bool initialized;
};

#endif // SEESAW_SOIL_SENSOR_HPP
