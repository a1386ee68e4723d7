#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <cstdint>
#include <mqtt_client.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <main/network/session_event_buffer.hpp>
#include <main/network/telemetry_session.hpp>

// esp-mqtt wrapper. Broker events arrive on the esp-mqtt task and are
// buffered; they reach the observer only when the owner calls dispatchEvents().
class MqttClient {
public:
    MqttClient(const char* host, int port, const char* client_id,
               const char* username, const char* password);

    // Start the esp-mqtt task. Connection completes asynchronously.
    bool connect();
    void disconnect();

    // Block until the broker accepts the session or timeout_ms elapses
    bool waitForConnection(uint32_t timeout_ms);

    // Message id on success, negative when the session is down or the outbox is full
    int publish(const char* topic, const char* payload, int qos, bool retain);

    // Drain buffered events on the caller's task
    void dispatchEvents(SessionObserver* observer);

private:
    static constexpr EventBits_t SESSION_UP_BIT = BIT0;

    static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);
    void bufferEvent(SessionEventBuffer::EventType type, esp_mqtt_event_handle_t event);
    bool sessionUp() const;

    esp_mqtt_client_handle_t client;
    const char* host;
    int port;
    const char* client_id;
    const char* username;
    const char* password;
    char uri[96];

    StaticEventGroup_t status_storage;
    EventGroupHandle_t status;

    SessionEventBuffer events;
};

#endif // MQTT_CLIENT_HPP
