#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <optional>
#include <string_view>

namespace datastore {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Receives every message that passes the level filter. `message` is already formatted.
using log_sink_t = void (*)(log_level level, const char* tag, const char* message);

/// Process-wide logging state, defined in DatastoreCore/src/log.cpp.
extern std::atomic<log_level> g_log_level;
extern std::atomic<log_sink_t> g_log_sink;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

/// Replace the sink (nullptr restores the stderr default).
inline void set_log_sink(log_sink_t sink) {
    g_log_sink.store(sink, std::memory_order_relaxed);
}

const char* to_string(log_level level) noexcept;

/// Parses "off", "error", "warn", "info" or "debug". Used for DATASTORE_LOG_LEVEL.
std::optional<log_level> log_level_from_string(std::string_view name) noexcept;

/// Applies DATASTORE_LOG_LEVEL from the environment, if it is set and valid.
void init_log_level_from_env();

namespace detail {
    void log_message(log_level level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
}

}  // namespace datastore

#define DATASTORE_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(datastore::g_log_level.load(std::memory_order_relaxed))) { \
            datastore::detail::log_message(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) DATASTORE_LOG(datastore::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  DATASTORE_LOG(datastore::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  DATASTORE_LOG(datastore::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) DATASTORE_LOG(datastore::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
