#include <main/utils/esp_log_sink.hpp>

namespace EspLogSink {
    void install() {
        Logger::setSink(&EspLogSink::write);
    }

    void write(LogLevel level, const char* tag, const char* message) {
        switch (level) {
            case LogLevel::ERROR: ESP_LOGE(tag, "%s", message); break;
            case LogLevel::WARN:  ESP_LOGW(tag, "%s", message); break;
            case LogLevel::INFO:  ESP_LOGI(tag, "%s", message); break;
            case LogLevel::DEBUG: ESP_LOGD(tag, "%s", message); break;
            default:              ESP_LOGI(tag, "%s", message); break;
        }
    }

    void setEspLogLevel(const char* tag, esp_log_level_t level) {
        esp_log_level_set(tag, level);
    }
}
