#include <main/hardware/tsl2591_light_sensor.hpp>
#include <main/utils/logger.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static const char* TAG = "LIGHT_SENSOR";

// Command byte: CMD bit + normal transaction
static constexpr uint8_t TSL2591_COMMAND_BIT   = 0xA0;

static constexpr uint8_t TSL2591_REG_ENABLE    = 0x00;
static constexpr uint8_t TSL2591_REG_CONTROL   = 0x01;
static constexpr uint8_t TSL2591_REG_DEVICE_ID = 0x12;
static constexpr uint8_t TSL2591_REG_C0DATAL   = 0x14;

static constexpr uint8_t TSL2591_ENABLE_POWERON = 0x01;
static constexpr uint8_t TSL2591_ENABLE_AEN     = 0x02;
static constexpr uint8_t TSL2591_ENABLE_AIEN    = 0x10;
static constexpr uint8_t TSL2591_ENABLE_NPIEN   = 0x80;

static constexpr uint8_t TSL2591_DEVICE_ID     = 0x50;

Tsl2591LightSensor::Tsl2591LightSensor(I2cBus& bus_in,
                                       uint8_t addr_7bit,
                                       Tsl2591Lux::Gain gain_in,
                                       Tsl2591Lux::Integration integration_in)
    : bus(bus_in),
      addr(addr_7bit),
      gain(gain_in),
      integration(integration_in),
      initialized(false) {}

bool Tsl2591LightSensor::writeRegister(uint8_t reg, uint8_t value) {
    const uint8_t buf[2] = { static_cast<uint8_t>(TSL2591_COMMAND_BIT | reg), value };
    return bus.write(addr, buf, sizeof(buf));
}

bool Tsl2591LightSensor::readRegisters(uint8_t reg, uint8_t* out, size_t len) {
    const uint8_t cmd = static_cast<uint8_t>(TSL2591_COMMAND_BIT | reg);
    return bus.writeRead(addr, &cmd, 1, out, len);
}

bool Tsl2591LightSensor::init() {
    uint8_t id = 0;
    if (!readRegisters(TSL2591_REG_DEVICE_ID, &id, 1)) {
        LOG_ERROR(TAG, "No TSL2591 response at 0x%02X", addr);
        return false;
    }
    if (id != TSL2591_DEVICE_ID) {
        LOG_ERROR(TAG, "Unexpected TSL2591 device ID 0x%02X", id);
        return false;
    }
    const uint8_t control = static_cast<uint8_t>(gain) | static_cast<uint8_t>(integration);
    if (!writeRegister(TSL2591_REG_CONTROL, control)) {
        return false;
    }
    const uint8_t enable = TSL2591_ENABLE_POWERON | TSL2591_ENABLE_AEN |
                           TSL2591_ENABLE_AIEN | TSL2591_ENABLE_NPIEN;
    if (!writeRegister(TSL2591_REG_ENABLE, enable)) {
        return false;
    }
    // First conversion completes after one integration period
    vTaskDelay(pdMS_TO_TICKS(Tsl2591Lux::integrationMs(integration) + 20));
    initialized = true;
    LOG_INFO(TAG, "TSL2591 ready at 0x%02X (gain %.0fx, %lu ms)", addr,
             static_cast<double>(Tsl2591Lux::gainMultiplier(gain)),
             static_cast<unsigned long>(Tsl2591Lux::integrationMs(integration)));
    return true;
}

bool Tsl2591LightSensor::readLux(float& out_lux) {
    if (!initialized) {
        return false;
    }
    // C0DATAL..C1DATAH, little-endian channel pairs
    uint8_t buf[4] = { 0, 0, 0, 0 };
    if (!readRegisters(TSL2591_REG_C0DATAL, buf, sizeof(buf))) {
        return false;
    }
    const uint16_t full = static_cast<uint16_t>(buf[0] | (buf[1] << 8));
    const uint16_t ir = static_cast<uint16_t>(buf[2] | (buf[3] << 8));
    if (!Tsl2591Lux::compute(full, ir, gain, integration, out_lux)) {
        LOG_WARN(TAG, "Light channels saturated (full=%u ir=%u)", full, ir);
        return false;
    }
    return true;
}
