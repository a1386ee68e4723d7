#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdarg>

// Fixed-size formatting buffer to avoid heap usage
#ifndef LOGGER_MAX_MESSAGE_LEN
#define LOGGER_MAX_MESSAGE_LEN 256
#endif

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

// Receives each formatted, null-terminated message that passed the level gate.
using LogSink = void (*)(LogLevel level, const char* tag, const char* message);

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    // Install the output backend. Messages are dropped while no sink is set.
    static void setSink(LogSink sink);

    // Messages longer than the buffer end in "..."
    static void log(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

private:
    static void vlog(LogLevel level, const char* tag, const char* fmt, va_list args);

    static LogLevel s_level;
    static LogSink s_sink;
};

#define LOG_ERROR(TAG, FMT, ...) Logger::log(LogLevel::ERROR, (TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::log(LogLevel::WARN,  (TAG), (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::log(LogLevel::INFO,  (TAG), (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::log(LogLevel::DEBUG, (TAG), (FMT), ##__VA_ARGS__)

#endif // LOGGER_HPP
