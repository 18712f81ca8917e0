#pragma once

#include <cstdio>
#include <cstdarg>

namespace conduit {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Log category enable flags for fine-grained control
struct LogCategories {
    bool frame = false;     // Frame codec (very verbose)
    bool window = true;     // Frame / packet window tracking
    bool frag = true;       // Fragmentation and reassembly
    bool chan = true;       // Channel delivery and resends
    bool ack = false;       // Ack generation and validation
    bool cc = true;         // Congestion control
    bool conn = true;       // Connection state machine
};

inline LogCategories g_log_categories;

inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

// Core logging function
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when CONDUIT_LOG_DISABLE is defined
#ifdef CONDUIT_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    conduit::log(conduit::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    conduit::log(conduit::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    conduit::log(conduit::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (conduit::g_log_level >= conduit::LogLevel::DEBUG) \
        conduit::log(conduit::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (conduit::g_log_level >= conduit::LogLevel::TRACE) \
        conduit::log(conduit::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_FRAME(level, fmt, ...) \
    do { if (conduit::g_log_categories.frame) LOG_##level("FRAME", fmt, ##__VA_ARGS__); } while(0)

#define LOG_WINDOW(level, fmt, ...) \
    do { if (conduit::g_log_categories.window) LOG_##level("WINDOW", fmt, ##__VA_ARGS__); } while(0)

#define LOG_FRAG(level, fmt, ...) \
    do { if (conduit::g_log_categories.frag) LOG_##level("FRAG", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CHAN(level, fmt, ...) \
    do { if (conduit::g_log_categories.chan) LOG_##level("CHAN", fmt, ##__VA_ARGS__); } while(0)

#define LOG_ACK(level, fmt, ...) \
    do { if (conduit::g_log_categories.ack) LOG_##level("ACK", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CC(level, fmt, ...) \
    do { if (conduit::g_log_categories.cc) LOG_##level("CC", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CONN(level, fmt, ...) \
    do { if (conduit::g_log_categories.conn) LOG_##level("CONN", fmt, ##__VA_ARGS__); } while(0)

} // namespace conduit
