#include <main/utils/logger.hpp>
#include <cstddef>
#include <cstdio>

static constexpr const char* TRUNCATION_MARK = "...";
static constexpr int TRUNCATION_MARK_LEN = 3;

LogLevel Logger::s_level = LogLevel::INFO;
LogSink Logger::s_sink = nullptr;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

bool Logger::isEnabled(LogLevel level) {
    return s_sink != nullptr && static_cast<int>(level) <= static_cast<int>(s_level);
}

void Logger::setSink(LogSink sink) {
    s_sink = sink;
}

void Logger::log(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, tag, fmt, args);
    va_end(args);
}

void Logger::vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(level)) {
        return;
    }

    char buffer[LOGGER_MAX_MESSAGE_LEN];
    const int written = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (written < 0) {
        s_sink(level, tag, "formatting error");
        return;
    }
    if (static_cast<std::size_t>(written) >= sizeof(buffer)) {
        char* tail = buffer + sizeof(buffer) - 1 - TRUNCATION_MARK_LEN;
        std::snprintf(tail, TRUNCATION_MARK_LEN + 1, "%s", TRUNCATION_MARK);
    }
    s_sink(level, tag, buffer);
}
