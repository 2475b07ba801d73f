#ifndef EYEMAP_LOG_HPP
#define EYEMAP_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace eyemap {
namespace log {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

inline const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "LOG";
}

// Callback receives the level and a formatted message (no newline at end)
using LogCallback = void (*)(Level level, const char* message);

// When null, messages go to stdout (debug/info) or stderr (warn/error)
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void log_output(Level level, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             level_name(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
        return;
    }

    FILE* stream = (level == Level::Warn || level == Level::Error) ? stderr : stdout;
    fprintf(stream, "%s\n", full_message);
    fflush(stream);
}

} // namespace log
} // namespace eyemap

#ifdef EYEMAP_ENABLE_DEBUG_OUTPUT
    #define EYEMAP_LOG_DEBUG(fmt, ...) ::eyemap::log::log_output(::eyemap::log::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define EYEMAP_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define EYEMAP_LOG_INFO(fmt, ...) ::eyemap::log::log_output(::eyemap::log::Level::Info, fmt, ##__VA_ARGS__)
#define EYEMAP_LOG_WARN(fmt, ...) ::eyemap::log::log_output(::eyemap::log::Level::Warn, fmt, ##__VA_ARGS__)
#define EYEMAP_LOG_ERROR(fmt, ...) ::eyemap::log::log_output(::eyemap::log::Level::Error, fmt, ##__VA_ARGS__)

#endif // EYEMAP_LOG_HPP
