#include <main/network/feed_format.hpp>
#include <cstdio>
#include <cstring>

namespace {
    static const char* FEEDS_SEGMENT = "/feeds/";

    static bool fits(int written, std::size_t out_size) {
        return written >= 0 && static_cast<std::size_t>(written) < out_size;
    }
}

namespace FeedFormat {
    bool topic(char* out, std::size_t out_size, const char* username, const char* feed) {
        if (out == nullptr || out_size == 0 || username == nullptr || feed == nullptr) {
            return false;
        }
        int n = std::snprintf(out, out_size, "%s%s%s", username, FEEDS_SEGMENT, feed);
        return fits(n, out_size);
    }

    bool value(char* out, std::size_t out_size, float value) {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        int n = std::snprintf(out, out_size, "%.2f", static_cast<double>(value));
        return fits(n, out_size);
    }

    const char* feedFromTopic(const char* topic) {
        if (topic == nullptr) {
            return "";
        }
        const char* found = std::strstr(topic, FEEDS_SEGMENT);
        if (found == nullptr) {
            return topic;
        }
        return found + std::strlen(FEEDS_SEGMENT);
    }
}
