#ifndef LOGGING_SESSION_OBSERVER_HPP
#define LOGGING_SESSION_OBSERVER_HPP

#include <main/network/telemetry_session.hpp>

// Reports every broker event to the log.
class LoggingSessionObserver : public SessionObserver {
public:
    void onConnected() override;
    void onDisconnected() override;
    void onSubscribed(int msg_id) override;
    void onUnsubscribed(int msg_id) override;
    void onMessage(const char* feed, const char* payload) override;
};

#endif // LOGGING_SESSION_OBSERVER_HPP
