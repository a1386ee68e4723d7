#include <main/network/mqtt_client.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <cstdio>
#include <cstring>

static const char* TAG = "MqttClient";

MqttClient::MqttClient(const char* host_in, int port_in, const char* client_id_in,
                       const char* username_in, const char* password_in)
    : client(nullptr),
      host(host_in),
      port(port_in),
      client_id(client_id_in),
      username(username_in),
      password(password_in),
      uri{},
      status_storage{},
      status(nullptr),
      events() {
    status = xEventGroupCreateStatic(&status_storage);
}

bool MqttClient::connect() {
    if (client != nullptr) {
        return true;
    }

    std::snprintf(uri, sizeof(uri), "mqtt://%s:%d", host, port);
    esp_mqtt_client_config_t cfg = {};
    cfg.broker.address.uri = uri;
    cfg.credentials.client_id = client_id;
    cfg.credentials.username = username;
    cfg.credentials.authentication.password = password;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.network.timeout_ms = static_cast<int>(Config::Mqtt::network_timeout_ms);

    LOG_INFO(TAG, "Connecting to %s as %s", uri, client_id);

    client = esp_mqtt_client_init(&cfg);
    if (client == nullptr) {
        LOG_ERROR(TAG, "%s", "esp_mqtt_client_init failed");
        return false;
    }
    esp_err_t err = esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &MqttClient::mqttEventHandler, this);
    if (err == ESP_OK) {
        err = esp_mqtt_client_start(client);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Client start failed: %s", esp_err_to_name(err));
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        return false;
    }
    return true;
}

void MqttClient::disconnect() {
    if (client == nullptr) {
        return;
    }
    (void)esp_mqtt_client_stop(client);
    (void)esp_mqtt_client_destroy(client);
    client = nullptr;
    xEventGroupClearBits(status, SESSION_UP_BIT);
}

bool MqttClient::sessionUp() const {
    return (xEventGroupGetBits(status) & SESSION_UP_BIT) != 0;
}

bool MqttClient::waitForConnection(uint32_t timeout_ms) {
    const EventBits_t bits = xEventGroupWaitBits(status, SESSION_UP_BIT, pdFALSE, pdTRUE,
                                                 pdMS_TO_TICKS(timeout_ms));
    if ((bits & SESSION_UP_BIT) == 0) {
        LOG_ERROR(TAG, "Broker not connected after %lu ms", static_cast<unsigned long>(timeout_ms));
        return false;
    }
    return true;
}

int MqttClient::publish(const char* topic, const char* payload, int qos, bool retain) {
    if (client == nullptr || !sessionUp()) {
        LOG_WARN(TAG, "Not connected, cannot publish to %s", topic);
        return -1;
    }
    const int length = static_cast<int>(std::strlen(payload));
    const int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid < 0) {
        LOG_ERROR(TAG, "Publish to %s failed (rc=%d)", topic, mid);
    } else {
        LOG_DEBUG(TAG, "%s <- %s (mid=%d)", topic, payload, mid);
    }
    return mid;
}

void MqttClient::dispatchEvents(SessionObserver* observer) {
    (void)events.dispatch(observer);
}

void MqttClient::bufferEvent(SessionEventBuffer::EventType type, esp_mqtt_event_handle_t event) {
    const bool kept = (type == SessionEventBuffer::EventType::DATA)
        ? events.push(type, event->msg_id, event->topic, event->topic_len, event->data, event->data_len)
        : events.push(type, event->msg_id);
    if (!kept) {
        LOG_WARN(TAG, "%s", "Event buffer full, dropped event");
    }
}

void MqttClient::mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data) {
    (void)base;
    (void)event_id;
    static_cast<MqttClient*>(handler_args)->handleEvent(static_cast<esp_mqtt_event_handle_t>(event_data));
}

void MqttClient::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED:
            xEventGroupSetBits(status, SESSION_UP_BIT);
            bufferEvent(SessionEventBuffer::EventType::CONNECTED, event);
            break;
        case MQTT_EVENT_DISCONNECTED:
            xEventGroupClearBits(status, SESSION_UP_BIT);
            bufferEvent(SessionEventBuffer::EventType::DISCONNECTED, event);
            break;
        case MQTT_EVENT_SUBSCRIBED:
            bufferEvent(SessionEventBuffer::EventType::SUBSCRIBED, event);
            break;
        case MQTT_EVENT_UNSUBSCRIBED:
            bufferEvent(SessionEventBuffer::EventType::UNSUBSCRIBED, event);
            break;
        case MQTT_EVENT_DATA:
            bufferEvent(SessionEventBuffer::EventType::DATA, event);
            break;
        case MQTT_EVENT_ERROR:
            if (event->error_handle != nullptr) {
                LOG_ERROR(TAG, "Transport error (type=%d)", static_cast<int>(event->error_handle->error_type));
            } else {
                LOG_ERROR(TAG, "%s", "Transport error");
            }
            break;
        default:
            break;
    }
}
