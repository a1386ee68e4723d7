#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>
#include <main/tasks/sampling_loop.hpp>
#include <main/hardware/tsl2591_lux.hpp>
#include <driver/gpio.h>

namespace Config {
namespace Wifi {
    // Behavior
    static constexpr int max_retry_count = 5;              // Driver-level reconnect attempts per connect()
    static constexpr uint32_t connect_timeout_ms = 20000;  // Wait for an IP before giving up
}

namespace Device {
    // Also used as the MQTT client id
    static constexpr const char* id = "plant-watch";
}

namespace Provisioning {
    // NVS namespace whose string keys override the compiled-in secrets
    static constexpr const char* nvs_namespace = "secrets";
}

namespace Hardware {
// Shared I2C master bus (STEMMA QT connector on the Feather)
namespace I2c {
    static constexpr int port = 0; // I2C_NUM_0
    static constexpr gpio_num_t sda = GPIO_NUM_23;
    static constexpr gpio_num_t scl = GPIO_NUM_22;
    static constexpr uint32_t clk_hz = 100000; // 100 kHz
    static constexpr uint32_t timeout_ms = 100;
}

// Adafruit STEMMA capacitive soil sensor (seesaw)
namespace Soil {
    static constexpr uint8_t addr = 0x36;
}

namespace Light {
    static constexpr uint8_t addr = 0x29;
    static constexpr Tsl2591Lux::Gain gain = Tsl2591Lux::Gain::MED;
    static constexpr Tsl2591Lux::Integration integration = Tsl2591Lux::Integration::MS_100;
}

// 128x32 SSD1306 OLED FeatherWing
namespace Display {
    static constexpr uint8_t addr = 0x3C;
    static constexpr uint16_t width = 128;
    static constexpr uint16_t height = 32;
    static constexpr gpio_num_t reset_gpio = GPIO_NUM_15;
}
}

namespace Mqtt {
    static constexpr const char* host = "io.adafruit.com";
    static constexpr int port = 1883;

    // Session behavior
    static constexpr uint16_t keepalive_seconds = 60;
    static constexpr int telemetry_qos = 0;
    static constexpr bool telemetry_retain = false;
    static constexpr uint32_t connect_timeout_ms = 15000;
    // Per-operation socket timeout; bounds a publish or stop on a dead link
    static constexpr uint32_t network_timeout_ms = 10000;
}

namespace Sampling {
    static constexpr uint32_t interval_ms = 60000;
    // Yield between polls so the idle and network tasks run
    static constexpr uint32_t poll_period_ms = 100;
    static constexpr SensorFailurePolicy sensor_failure_policy = SensorFailurePolicy::HALT;
}

namespace Watchdog {
    // Worst failing cycle: publish blocked on a dead socket, client stop,
    // WiFi IP wait, broker wait. 10 + 10 + 20 + 15 s plus margin.
    static constexpr uint32_t timeout_ms = 90000;
    static_assert(timeout_ms >= 2 * Mqtt::network_timeout_ms + Wifi::connect_timeout_ms
                                    + Mqtt::connect_timeout_ms + 10000,
                  "Watchdog must outlast a failed publish followed by a full reset");
}

namespace Fatal {
    // Time to flush logs before restarting
    static constexpr uint32_t restart_delay_ms = 5000;
}
}

#endif // CONFIG_HPP
