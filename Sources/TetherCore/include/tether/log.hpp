#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <optional>
#include <string>

namespace tether {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide log level, defined in TetherCore/src/tether.cpp. Off until
/// set here or through configuration::logging.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

const char* to_string(log_level level);

/// Lowercase level name ("off" .. "debug"); nullopt for anything else.
std::optional<log_level> parse_log_level(const std::string& name);

// Subsystem tags, printed as the message prefix
namespace log_tag {
inline constexpr const char* entity = "tether.entity";
inline constexpr const char* snapshot = "tether.snapshot";
inline constexpr const char* manager = "tether.manager";
inline constexpr const char* registry = "tether.registry";
inline constexpr const char* codec = "tether.codec";
inline constexpr const char* db = "tether.db";
}  // namespace log_tag

}  // namespace tether

#define TETHER_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(tether::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] %s: " fmt "\n", tag, tether::to_string(level), ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) TETHER_LOG(tether::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  TETHER_LOG(tether::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  TETHER_LOG(tether::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) TETHER_LOG(tether::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
