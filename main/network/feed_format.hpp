// Topic and payload formatting for the Adafruit IO MQTT API.
#ifndef FEED_FORMAT_HPP
#define FEED_FORMAT_HPP

#include <cstddef>

namespace FeedFormat {
    // "<username>/feeds/<feed>". Returns false if out is too small.
    bool topic(char* out, std::size_t out_size, const char* username, const char* feed);

    // Value with two decimals, e.g. "46.45". Returns false if out is too small.
    bool value(char* out, std::size_t out_size, float value);

    // Feed key of a feed topic; returns the topic itself when it is not one.
    const char* feedFromTopic(const char* topic);
}

#endif // FEED_FORMAT_HPP
