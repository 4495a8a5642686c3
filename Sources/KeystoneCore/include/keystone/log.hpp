#pragma once

#ifdef __cplusplus

#include <atomic>
#include <cstdio>

namespace keystone {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

// Process-wide threshold, defined in keystone.cpp. Defaults to warn so
// lenient-mode recoveries are visible.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return level != log_level::off && static_cast<int>(level) <= static_cast<int>(get_log_level());
}

constexpr const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::error: return "ERROR";
        case log_level::warn:  return "WARN";
        case log_level::info:  return "INFO";
        case log_level::debug: return "DEBUG";
        default:               return "OFF";
    }
}

}  // namespace keystone

// One fprintf per message keeps lines from concurrent threads whole
#define KEYSTONE_LOG(level, tag, fmt, ...) \
    do { \
        if (keystone::log_enabled(level)) { \
            std::fprintf(stderr, "[keystone][%s][%s] " fmt "\n", \
                         keystone::log_level_name(level), tag, ##__VA_ARGS__); \
        } \
    } while (0)

#define LOG_ERROR(tag, fmt, ...) KEYSTONE_LOG(keystone::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  KEYSTONE_LOG(keystone::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  KEYSTONE_LOG(keystone::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) KEYSTONE_LOG(keystone::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
