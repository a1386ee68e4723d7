#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

WiFiManager::WiFiManager(const char* ssid_in, const char* password_in)
    : ssid(ssid_in),
      password(password_in),
      initialized(false),
      auto_retry(false),
      retry_count(0),
      status_storage{},
      status(nullptr),
      wifi_handler(nullptr),
      ip_handler(nullptr) {}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    status = xEventGroupCreateStatic(&status_storage);

    esp_err_t err = esp_netif_init();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_netif_init failed: %s", esp_err_to_name(err));
        return false;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %s", esp_err_to_name(err));
        return false;
    }
    if (esp_netif_create_default_wifi_sta() == nullptr) {
        LOG_ERROR(TAG, "%s", "Station netif create failed");
        return false;
    }

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_init failed: %s", esp_err_to_name(err));
        return false;
    }

    err = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                              &WiFiManager::wifiEventHandler, this, &wifi_handler);
    if (err == ESP_OK) {
        err = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                                  &WiFiManager::ipEventHandler, this, &ip_handler);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Handler register failed: %s", esp_err_to_name(err));
        return false;
    }

    if (!applyStationConfig()) {
        return false;
    }
    err = esp_wifi_start();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_start failed: %s", esp_err_to_name(err));
        return false;
    }

    initialized = true;
    return true;
}

bool WiFiManager::applyStationConfig() {
    esp_err_t err = esp_wifi_set_mode(WIFI_MODE_STA);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_set_mode failed: %s", esp_err_to_name(err));
        return false;
    }

    wifi_config_t wifi_config = {};
    std::snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid), sizeof(wifi_config.sta.ssid), "%s", ssid);
    std::snprintf(reinterpret_cast<char*>(wifi_config.sta.password), sizeof(wifi_config.sta.password), "%s", password);
    // Open networks are allowed when no passphrase is configured
    wifi_config.sta.threshold.authmode = (password[0] == '\0') ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_set_config failed: %s", esp_err_to_name(err));
        return false;
    }
    return true;
}

bool WiFiManager::connect() {
    if (!init()) {
        return false;
    }
    retry_count = 0;
    auto_retry = true;
    xEventGroupClearBits(status, GOT_IP_BIT | GAVE_UP_BIT);

    LOG_INFO(TAG, "Connecting to %s", ssid);
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
        return false;
    }
    return true;
}

void WiFiManager::disconnect() {
    // The disconnect event we are about to cause must not trigger a retry
    auto_retry = false;
    if (initialized) {
        (void)esp_wifi_disconnect();
        xEventGroupClearBits(status, GOT_IP_BIT);
    }
}

bool WiFiManager::reset() {
    if (!initialized) {
        return connect();
    }
    LOG_WARN(TAG, "%s", "Restarting WiFi driver");
    disconnect();
    esp_err_t err = esp_wifi_stop();
    if (err == ESP_OK) {
        err = esp_wifi_start();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Driver restart failed: %s", esp_err_to_name(err));
        return false;
    }
    return connect();
}

bool WiFiManager::waitForIp(uint32_t timeout_ms) {
    if (status == nullptr) {
        return false;
    }
    const EventBits_t bits = xEventGroupWaitBits(status, GOT_IP_BIT | GAVE_UP_BIT,
                                                 pdFALSE, pdFALSE, pdMS_TO_TICKS(timeout_ms));
    if (bits & GOT_IP_BIT) {
        return true;
    }
    if (bits & GAVE_UP_BIT) {
        LOG_ERROR(TAG, "Gave up on %s after %d retries", ssid, Config::Wifi::max_retry_count);
    } else {
        LOG_ERROR(TAG, "No IP after %lu ms", static_cast<unsigned long>(timeout_ms));
    }
    return false;
}

void WiFiManager::onWifiEvent(int32_t event_id) {
    switch (event_id) {
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "Associated with %s", ssid);
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            xEventGroupClearBits(status, GOT_IP_BIT);
            if (!auto_retry) {
                LOG_INFO(TAG, "%s", "Disconnected");
                break;
            }
            if (retry_count < Config::Wifi::max_retry_count) {
                retry_count++;
                LOG_WARN(TAG, "Link lost, retrying (%d/%d)", retry_count, Config::Wifi::max_retry_count);
                (void)esp_wifi_connect();
            } else {
                xEventGroupSetBits(status, GAVE_UP_BIT);
            }
            break;
        case WIFI_EVENT_STA_STOP:
            xEventGroupClearBits(status, GOT_IP_BIT);
            break;
        default:
            break;
    }
}

void WiFiManager::onGotIp() {
    retry_count = 0;
    xEventGroupSetBits(status, GOT_IP_BIT);
    LOG_INFO(TAG, "%s", "Got IP address");
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    (void)event_base;
    (void)event_data;
    static_cast<WiFiManager*>(arg)->onWifiEvent(event_id);
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    (void)event_base;
    (void)event_data;
    if (event_id == IP_EVENT_STA_GOT_IP) {
        static_cast<WiFiManager*>(arg)->onGotIp();
    }
}
