#ifndef TSL2591_LIGHT_SENSOR_HPP
#define TSL2591_LIGHT_SENSOR_HPP

#include <cstdint>
#include <main/hardware/i2c_bus.hpp>
#include <main/hardware/tsl2591_lux.hpp>

// AMS TSL2591 ambient light sensor. Stays powered with the ALS enabled so a
// fresh conversion is always available after the first integration period.
class Tsl2591LightSensor {
public:
    Tsl2591LightSensor(I2cBus& bus,
                       uint8_t addr_7bit,
                       Tsl2591Lux::Gain gain,
                       Tsl2591Lux::Integration integration);

    // Verify device ID, apply gain/integration and power up
    bool init();

    bool readLux(float& out_lux);

private:
    bool writeRegister(uint8_t reg, uint8_t value);
    bool readRegisters(uint8_t reg, uint8_t* out, size_t len);

    I2cBus& bus;
    uint8_t addr;
    Tsl2591Lux::Gain gain;
    Tsl2591Lux::Integration integration;
    bool initialized;
};

#endif // TSL2591_LIGHT_SENSOR_HPP
