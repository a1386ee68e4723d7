#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <cstdint>
#include <esp_event.h>
#include <esp_netif.h>
#include <esp_wifi.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

// Station-mode link to the configured access point. Connection progress is
// published by the event loop task through an event group; callers block on
// it with waitForIp().
class WiFiManager {
public:
    WiFiManager(const char* ssid, const char* password);

    // Netif, driver and handlers. NVS must already be initialized.
    bool init();

    // Start associating. Returns once the request is issued.
    bool connect();
    void disconnect();

    // Restart the driver and associate again
    bool reset();

    // Block until DHCP assigns an address, retries run out, or timeout_ms elapses
    bool waitForIp(uint32_t timeout_ms);

private:
    static constexpr EventBits_t GOT_IP_BIT = BIT0;
    static constexpr EventBits_t GAVE_UP_BIT = BIT1;

    bool applyStationConfig();
    void onWifiEvent(int32_t event_id);
    void onGotIp();

    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    const char* ssid;
    const char* password;

    bool initialized;
    // Written from the event loop task
    volatile bool auto_retry;
    int retry_count;

    StaticEventGroup_t status_storage;
    EventGroupHandle_t status;

    esp_event_handler_instance_t wifi_handler;
    esp_event_handler_instance_t ip_handler;
};

#endif // WIFI_MANAGER_HPP
