#ifndef ESP_LOG_SINK_HPP
#define ESP_LOG_SINK_HPP

#include <esp_log.h>
#include <main/utils/logger.hpp>

// Logger backend that forwards to the ESP-IDF log component.
namespace EspLogSink {
    // Install as the Logger sink. Call first thing in app_main.
    void install();

    void write(LogLevel level, const char* tag, const char* message);

    // Optional helper to align ESP-IDF internal log level for a tag
    void setEspLogLevel(const char* tag, esp_log_level_t level);
}

#endif // ESP_LOG_SINK_HPP
