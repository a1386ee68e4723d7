#ifndef ADAFRUIT_IO_SESSION_HPP
#define ADAFRUIT_IO_SESSION_HPP

#include <main/network/telemetry_session.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/network/mqtt_client.hpp>

// Adafruit IO over MQTT: WiFi station link plus one broker session.
// Values go to "<username>/feeds/<feed>".
class AdafruitIoSession : public TelemetrySession {
public:
    AdafruitIoSession(WiFiManager& wifi, MqttClient& mqtt, const char* username);

    bool connect() override;
    bool publish(const char* feed, float value) override;
    bool reset() override;
    void service() override;

    void setObserver(SessionObserver* observer);

private:
    bool openBrokerSession();

    WiFiManager& wifi;
    MqttClient& mqtt;
    const char* username;
    SessionObserver* observer;
};

#endif // ADAFRUIT_IO_SESSION_HPP
