#ifndef PRAM_DEBUG_LOG_HPP
#define PRAM_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>

namespace pram {
namespace debug {

enum class Level : std::uint8_t {
    DEBUG,
    WARN
};

inline const char* level_name(Level level) {
    return level == Level::WARN ? "WARN" : "DEBUG";
}

// Receives the formatted message (no trailing newline) and its level
using LogCallback = void (*)(Level level, const char* message);

// Set by the embedding driver to route messages elsewhere; when null, messages go to stderr
inline std::atomic<LogCallback> g_log_callback{nullptr};

// Messages below this level are dropped at runtime
inline std::atomic<Level> g_min_level{Level::DEBUG};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void set_min_level(Level level) {
    g_min_level.store(level, std::memory_order_relaxed);
}

inline void log_output(Level level, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][pram] %s", level_name(level), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

} // namespace debug
} // namespace pram

// Debug tracing compiles away unless PRAM_ENABLE_DEBUG_OUTPUT is defined
#ifdef PRAM_ENABLE_DEBUG_OUTPUT
    #define PRAM_DEBUG_LOG(fmt, ...) ::pram::debug::log_output(::pram::debug::Level::DEBUG, fmt, ##__VA_ARGS__)
#else
    #define PRAM_DEBUG_LOG(fmt, ...) ((void)0)
#endif

// Warnings are always compiled in
#define PRAM_WARN_LOG(fmt, ...) ::pram::debug::log_output(::pram::debug::Level::WARN, fmt, ##__VA_ARGS__)

#endif // PRAM_DEBUG_LOG_HPP
