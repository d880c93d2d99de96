#include "datastore/log.hpp"
#include <cstdarg>
#include <cstdlib>
#include <string>

namespace datastore {

// Single definitions of the global logging state (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};
std::atomic<log_sink_t> g_log_sink{nullptr};

const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

std::optional<log_level> log_level_from_string(std::string_view name) noexcept {
    for (auto level : {log_level::off, log_level::error, log_level::warn,
                       log_level::info, log_level::debug}) {
        if (name == to_string(level)) return level;
    }
    return std::nullopt;
}

void init_log_level_from_env() {
    const char* value = std::getenv("DATASTORE_LOG_LEVEL");
    if (!value) return;
    if (auto level = log_level_from_string(value)) {
        set_log_level(*level);
    } else {
        std::fprintf(stderr, "[log] ignoring unknown DATASTORE_LOG_LEVEL '%s'\n", value);
    }
}

namespace detail {

void log_message(log_level level, const char* tag, const char* fmt, ...) {
    char buffer[512];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    // Long messages get a heap buffer rather than being truncated
    std::string message;
    if (n >= static_cast<int>(sizeof(buffer))) {
        message.resize(static_cast<size_t>(n) + 1);
        va_start(args, fmt);
        std::vsnprintf(message.data(), message.size(), fmt, args);
        va_end(args);
        message.resize(static_cast<size_t>(n));
    } else {
        message.assign(buffer, n < 0 ? 0 : static_cast<size_t>(n));
    }

    if (auto sink = g_log_sink.load(std::memory_order_relaxed)) {
        sink(level, tag, message.c_str());
        return;
    }
    std::fprintf(stderr, "[%s] %s\n", tag, message.c_str());
}

} // namespace detail

} // namespace datastore
