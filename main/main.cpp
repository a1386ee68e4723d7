#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_system.h>
#include <nvs_flash.h>
#include <main/utils/logger.hpp>
#include <main/utils/esp_log_sink.hpp>
#include <main/utils/esp_monotonic_clock.hpp>
#include <main/utils/watchdog.hpp>
#include <main/config/config.hpp>
#include <main/state/credentials.hpp>
#include <main/state/credential_store.hpp>
#include <main/hardware/i2c_bus.hpp>
#include <main/hardware/seesaw_soil_sensor.hpp>
#include <main/hardware/tsl2591_light_sensor.hpp>
#include <main/hardware/board_sensors.hpp>
#include <main/hardware/ssd1306_display.hpp>
#include <main/display/status_screen.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/adafruit_io_session.hpp>
#include <main/network/logging_session_observer.hpp>
#include <main/tasks/sampling_loop.hpp>

static const char* TAG = "MAIN";

// Setup failures cannot be recovered in place; restart the board
[[noreturn]] static void fatal(const char* what) {
    LOG_ERROR(TAG, "Fatal: %s; restarting in %lu ms", what,
              static_cast<unsigned long>(Config::Fatal::restart_delay_ms));
    vTaskDelay(pdMS_TO_TICKS(Config::Fatal::restart_delay_ms));
    esp_restart();
}

extern "C" void app_main(void)
{
    EspLogSink::install();
    Logger::setLevel(LogLevel::INFO);
    // The WiFi driver is chatty at INFO
    EspLogSink::setEspLogLevel("wifi", ESP_LOG_WARN);
    LOG_INFO(TAG, "%s", "---Plant Watch 2.0 started---");

    // NVS holds provisioned credentials and is required by WiFi
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS init failed: %d", static_cast<int>(err));
        fatal("NVS unavailable");
    }

    // Sensors and display share one bus
    static I2cBus s_bus(static_cast<i2c_port_t>(Config::Hardware::I2c::port),
                        Config::Hardware::I2c::sda,
                        Config::Hardware::I2c::scl,
                        Config::Hardware::I2c::clk_hz,
                        Config::Hardware::I2c::timeout_ms);
    if (!s_bus.init()) {
        fatal("I2C bus init failed");
    }
    s_bus.scan();

    static SeesawSoilSensor s_soil(s_bus, Config::Hardware::Soil::addr);
    if (!s_soil.init()) {
        fatal("soil sensor not responding");
    }
    static Tsl2591LightSensor s_light(s_bus,
                                      Config::Hardware::Light::addr,
                                      Config::Hardware::Light::gain,
                                      Config::Hardware::Light::integration);
    if (!s_light.init()) {
        fatal("light sensor not responding");
    }
    static BoardSensors s_sensors(s_soil, s_light);

    // Splash stays on screen for the life of the process
    static Ssd1306Display s_display(s_bus,
                                    Config::Hardware::Display::addr,
                                    Config::Hardware::Display::width,
                                    Config::Hardware::Display::height,
                                    Config::Hardware::Display::reset_gpio);
    static StatusScreen s_screen(Config::Hardware::Display::height);
    if (!s_display.init()) {
        fatal("display not responding");
    }
    s_screen.renderSplash();
    if (!s_display.show(s_screen.buffer(), s_screen.bufferSize())) {
        LOG_WARN(TAG, "%s", "Splash screen write failed");
    }

    static Credentials s_credentials;
    if (!CredentialStore::load(s_credentials)) {
        fatal("credential load failed");
    }
    if (const char* missing = s_credentials.firstMissing()) {
        LOG_ERROR(TAG, "Credential '%s' is not set; add it to secrets.hpp or NVS namespace '%s'",
                  missing, Config::Provisioning::nvs_namespace);
        fatal("missing credentials");
    }

    static WiFiManager s_wifi(s_credentials.ssid(), s_credentials.password());
    if (!s_wifi.init()) {
        fatal("WiFi init failed");
    }
    static MqttClient s_mqtt(Config::Mqtt::host,
                             Config::Mqtt::port,
                             Config::Device::id,
                             s_credentials.aioUsername(),
                             s_credentials.aioKey());
    static LoggingSessionObserver s_observer;
    static AdafruitIoSession s_session(s_wifi, s_mqtt, s_credentials.aioUsername());
    s_session.setObserver(&s_observer);
    if (!s_session.connect()) {
        fatal("could not reach WiFi/Adafruit IO");
    }

    static EspMonotonicClock s_clock;
    SamplingLoop::Settings settings{};
    settings.interval_ms = Config::Sampling::interval_ms;
    settings.sensor_failure_policy = Config::Sampling::sensor_failure_policy;
    static SamplingLoop s_loop(s_sensors, s_session, s_clock, settings);

    static LoopWatchdog s_watchdog(Config::Watchdog::timeout_ms);
    if (!s_watchdog.start()) {
        LOG_WARN(TAG, "%s", "Running without task watchdog");
    }

    for (;;) {
        SamplingLoop::PollResult result = s_loop.poll();
        if (result == SamplingLoop::PollResult::SENSOR_FATAL) {
            fatal("sensor read failed");
        }
        s_watchdog.feed();
        vTaskDelay(pdMS_TO_TICKS(Config::Sampling::poll_period_ms));
    }
}
