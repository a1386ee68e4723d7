#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <esp_task_wdt.h>

static const char* TAG = "WATCHDOG";

LoopWatchdog::LoopWatchdog(uint32_t timeout_ms_in)
    : timeout_ms(timeout_ms_in), running(false) {}

bool LoopWatchdog::start() {
    // Idle tasks are not watched; the loop yields between polls
    esp_task_wdt_config_t config = {
        .timeout_ms = timeout_ms,
        .idle_core_mask = 0,
        .trigger_panic = true
    };
    esp_err_t err = esp_task_wdt_reconfigure(&config);
    if (err == ESP_ERR_INVALID_STATE) {
        // TWDT not started by the bootloader config
        err = esp_task_wdt_init(&config);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Configure failed: %s", esp_err_to_name(err));
        return false;
    }

    err = esp_task_wdt_add(nullptr);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Subscribe failed: %s", esp_err_to_name(err));
        return false;
    }

    running = true;
    LOG_INFO(TAG, "Armed with %lu ms timeout", static_cast<unsigned long>(timeout_ms));
    return true;
}

void LoopWatchdog::feed() {
    if (!running) {
        return;
    }
    (void)esp_task_wdt_reset();
}
