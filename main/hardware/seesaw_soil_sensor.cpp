#include <main/hardware/seesaw_soil_sensor.hpp>
#include <main/utils/logger.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static const char* TAG = "SOIL_SENSOR";

// Seesaw module/function registers
static constexpr uint8_t SEESAW_STATUS_BASE           = 0x00;
static constexpr uint8_t SEESAW_STATUS_HW_ID          = 0x01;
static constexpr uint8_t SEESAW_STATUS_TEMP           = 0x04;
static constexpr uint8_t SEESAW_STATUS_SWRST          = 0x7F;
static constexpr uint8_t SEESAW_TOUCH_BASE            = 0x0F;
static constexpr uint8_t SEESAW_TOUCH_CHANNEL_OFFSET  = 0x10;

// Hardware ID codes reported by seesaw boards
static constexpr uint8_t HW_ID_SAMD09    = 0x55;
static constexpr uint8_t HW_ID_TINY8X7_MIN = 0x84;
static constexpr uint8_t HW_ID_TINY8X7_MAX = 0x89;

// Conversion times used by the vendor driver
static constexpr uint32_t MOISTURE_DELAY_MS = 5;
static constexpr uint32_t TEMP_DELAY_MS = 5;
static constexpr uint32_t RESET_SETTLE_MS = 500;

// Touch readings above the ADC range are glitches; re-read a few times
static constexpr uint16_t MOISTURE_MAX_VALID = 4095;
static constexpr int MOISTURE_RETRIES = 3;

SeesawSoilSensor::SeesawSoilSensor(I2cBus& bus_in, uint8_t addr_7bit)
    : bus(bus_in), addr(addr_7bit), initialized(false) {}

bool SeesawSoilSensor::readRegister(uint8_t module, uint8_t function, uint8_t* out, size_t len, uint32_t delay_ms) {
    const uint8_t reg[2] = { module, function };
    if (!bus.write(addr, reg, sizeof(reg))) {
        return false;
    }
    // Seesaw needs time to prepare the response before the read phase
    vTaskDelay(pdMS_TO_TICKS(delay_ms));
    return bus.read(addr, out, len);
}

bool SeesawSoilSensor::init() {
    const uint8_t reset[3] = { SEESAW_STATUS_BASE, SEESAW_STATUS_SWRST, 0xFF };
    if (!bus.write(addr, reset, sizeof(reset))) {
        LOG_ERROR(TAG, "No seesaw response at 0x%02X", addr);
        return false;
    }
    vTaskDelay(pdMS_TO_TICKS(RESET_SETTLE_MS));

    uint8_t hw_id = 0;
    if (!readRegister(SEESAW_STATUS_BASE, SEESAW_STATUS_HW_ID, &hw_id, 1, 1)) {
        LOG_ERROR(TAG, "%s", "Failed to read seesaw hardware ID");
        return false;
    }
    if (hw_id != HW_ID_SAMD09 && (hw_id < HW_ID_TINY8X7_MIN || hw_id > HW_ID_TINY8X7_MAX)) {
        LOG_ERROR(TAG, "Unexpected seesaw hardware ID 0x%02X", hw_id);
        return false;
    }
    initialized = true;
    LOG_INFO(TAG, "Soil sensor ready at 0x%02X (hw id 0x%02X)", addr, hw_id);
    return true;
}

bool SeesawSoilSensor::readMoisture(uint16_t& out_raw) {
    if (!initialized) {
        return false;
    }
    for (int attempt = 0; attempt <= MOISTURE_RETRIES; ++attempt) {
        uint8_t buf[2] = { 0, 0 };
        if (!readRegister(SEESAW_TOUCH_BASE, SEESAW_TOUCH_CHANNEL_OFFSET, buf, sizeof(buf), MOISTURE_DELAY_MS)) {
            return false;
        }
        const uint16_t value = static_cast<uint16_t>((buf[0] << 8) | buf[1]);
        if (value <= MOISTURE_MAX_VALID) {
            out_raw = value;
            return true;
        }
        vTaskDelay(pdMS_TO_TICKS(1));
    }
    LOG_ERROR(TAG, "%s", "Could not get a valid moisture reading");
    return false;
}

bool SeesawSoilSensor::readTemperature(float& out_celsius) {
    if (!initialized) {
        return false;
    }
    uint8_t buf[4] = { 0, 0, 0, 0 };
    if (!readRegister(SEESAW_STATUS_BASE, SEESAW_STATUS_TEMP, buf, sizeof(buf), TEMP_DELAY_MS)) {
        return false;
    }
    // 16.16 fixed point; the two top bits are status flags
    buf[0] &= 0x3F;
    const uint32_t raw = (static_cast<uint32_t>(buf[0]) << 24) |
                         (static_cast<uint32_t>(buf[1]) << 16) |
                         (static_cast<uint32_t>(buf[2]) << 8) |
                         static_cast<uint32_t>(buf[3]);
    out_celsius = static_cast<float>(raw) / 65536.0f;
    return true;
}
