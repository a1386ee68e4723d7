#ifndef TELEMETRY_SESSION_HPP
#define TELEMETRY_SESSION_HPP

// Optional hooks for broker session events. Invoked only from
// TelemetrySession::service(), on the caller's task.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onConnected() {}
    virtual void onDisconnected() {}
    virtual void onSubscribed(int msg_id) { (void)msg_id; }
    virtual void onUnsubscribed(int msg_id) { (void)msg_id; }
    virtual void onMessage(const char* feed, const char* payload) { (void)feed; (void)payload; }
};

// Network link plus broker session used to publish telemetry.
class TelemetrySession {
public:
    virtual ~TelemetrySession() = default;

    // Associate the link and open the broker session. Blocking.
    virtual bool connect() = 0;

    // Send one value to one feed. False is a transport error.
    virtual bool publish(const char* feed, float value) = 0;

    // Tear down and re-establish link and session. Blocking.
    virtual bool reset() = 0;

    // Dispatch buffered inbound events to the observer, if any.
    virtual void service() = 0;
};

#endif // TELEMETRY_SESSION_HPP
