#include <main/network/session_event_buffer.hpp>
#include <main/network/feed_format.hpp>
#include <algorithm>
#include <cstring>

template <std::size_t N>
static void copyField(char (&dest)[N], const char* src, int len) {
    if (src == nullptr || len <= 0) {
        dest[0] = '\0';
        return;
    }
    const std::size_t n = std::min(static_cast<std::size_t>(len), N - 1);
    std::memcpy(dest, src, n);
    dest[n] = '\0';
}

bool SessionEventBuffer::push(EventType type, int msg_id,
                              const char* topic, int topic_len,
                              const char* data, int data_len) {
    Event ev;
    ev.type = type;
    ev.msg_id = msg_id;
    copyField(ev.topic, topic, topic_len);
    copyField(ev.payload, data, data_len);
    return events.push(ev);
}

std::size_t SessionEventBuffer::dispatch(SessionObserver* observer) {
    std::size_t drained = 0;
    Event ev;
    while (events.pop(ev)) {
        ++drained;
        if (observer == nullptr) {
            continue;
        }
        switch (ev.type) {
            case EventType::CONNECTED:    observer->onConnected(); break;
            case EventType::DISCONNECTED: observer->onDisconnected(); break;
            case EventType::SUBSCRIBED:   observer->onSubscribed(ev.msg_id); break;
            case EventType::UNSUBSCRIBED: observer->onUnsubscribed(ev.msg_id); break;
            case EventType::DATA:
                observer->onMessage(FeedFormat::feedFromTopic(ev.topic), ev.payload);
                break;
        }
    }
    return drained;
}
