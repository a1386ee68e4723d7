#ifndef SESSION_EVENT_BUFFER_HPP
#define SESSION_EVENT_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <main/network/telemetry_session.hpp>
#include <main/utils/circular_buffer.hpp>

// Broker events handed from the MQTT client task to the loop task.
// push() runs on the client task and copies everything it needs, so the
// vendor event can be released right away; dispatch() runs on the loop task
// and is the only place the observer is invoked.
class SessionEventBuffer {
public:
    enum class EventType : uint8_t { CONNECTED, DISCONNECTED, SUBSCRIBED, UNSUBSCRIBED, DATA };

    static constexpr std::size_t kCapacity = 8;
    static constexpr std::size_t kTopicSize = 96;
    static constexpr std::size_t kPayloadSize = 128;

    // topic and data are length-delimited (not null-terminated) and are
    // truncated to fit. Returns false when the buffer is full; the event is dropped.
    bool push(EventType type, int msg_id,
              const char* topic = nullptr, int topic_len = 0,
              const char* data = nullptr, int data_len = 0);

    // Deliver pending events in arrival order. With no observer they are
    // discarded. Returns the number of events drained.
    std::size_t dispatch(SessionObserver* observer);

    std::size_t pending() const { return events.getCount(); }

private:
    struct Event {
        EventType type;
        int msg_id;
        char topic[kTopicSize];
        char payload[kPayloadSize];
    };

    CircularBuffer<Event, kCapacity> events;
};

#endif // SESSION_EVENT_BUFFER_HPP
