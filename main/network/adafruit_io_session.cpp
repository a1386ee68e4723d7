#include <main/network/adafruit_io_session.hpp>
#include <main/network/feed_format.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "AIO_SESSION";

AdafruitIoSession::AdafruitIoSession(WiFiManager& wifi_in, MqttClient& mqtt_in, const char* username_in)
    : wifi(wifi_in),
      mqtt(mqtt_in),
      username(username_in),
      observer(nullptr) {}

void AdafruitIoSession::setObserver(SessionObserver* observer_in) {
    observer = observer_in;
}

bool AdafruitIoSession::openBrokerSession() {
    LOG_INFO(TAG, "%s", "Connecting to Adafruit IO...");
    if (!mqtt.connect()) {
        return false;
    }
    return mqtt.waitForConnection(Config::Mqtt::connect_timeout_ms);
}

bool AdafruitIoSession::connect() {
    LOG_INFO(TAG, "%s", "Connecting to WiFi...");
    if (!wifi.connect() || !wifi.waitForIp(Config::Wifi::connect_timeout_ms)) {
        return false;
    }
    LOG_INFO(TAG, "%s", "Connected!");
    return openBrokerSession();
}

bool AdafruitIoSession::publish(const char* feed, float value) {
    char topic[128];
    char payload[32];
    if (!FeedFormat::topic(topic, sizeof(topic), username, feed)) {
        LOG_ERROR(TAG, "Topic too long for feed %s", feed);
        return false;
    }
    if (!FeedFormat::value(payload, sizeof(payload), value)) {
        LOG_ERROR(TAG, "Cannot format value for feed %s", feed);
        return false;
    }
    int mid = mqtt.publish(topic, payload, Config::Mqtt::telemetry_qos, Config::Mqtt::telemetry_retain);
    return mid >= 0;
}

bool AdafruitIoSession::reset() {
    mqtt.disconnect();
    if (!wifi.reset() || !wifi.waitForIp(Config::Wifi::connect_timeout_ms)) {
        return false;
    }
    return openBrokerSession();
}

void AdafruitIoSession::service() {
    mqtt.dispatchEvents(observer);
}
