#include <main/network/logging_session_observer.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "AIO";

void LoggingSessionObserver::onConnected() {
    LOG_INFO(TAG, "%s", "Connected to Adafruit IO!");
}

void LoggingSessionObserver::onDisconnected() {
    LOG_WARN(TAG, "%s", "Disconnected from Adafruit IO!");
}

void LoggingSessionObserver::onSubscribed(int msg_id) {
    LOG_INFO(TAG, "Subscribed (mid=%d)", msg_id);
}

void LoggingSessionObserver::onUnsubscribed(int msg_id) {
    LOG_INFO(TAG, "Unsubscribed (mid=%d)", msg_id);
}

void LoggingSessionObserver::onMessage(const char* feed, const char* payload) {
    LOG_INFO(TAG, "Feed %s received new value: %s", feed, payload);
}
