#pragma once

#include <fmt/core.h>

#include <optional>
#include <string_view>

namespace gitsvc::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

/**
 * @brief The global log threshold. Starts at the level named by GITSVC_LOG_LEVEL, or `warn` (only
 * speak up when something has gone wrong).
 */
extern level current_log_level;

void log_print(level l, std::string_view s) noexcept;

/**
 * @brief Apply the logging pattern, and re-read the log level from the environment
 * (GITSVC_LOG_LEVEL). Optional: the level is already taken from the environment at startup.
 */
void init_logger() noexcept;

/**
 * @brief Parse a level name ("trace", "debug", ..., "silent"). Returns nullopt if unrecognized.
 */
std::optional<level> parse_level(std::string_view name) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        auto message = fmt::format(fmt::runtime(s), args...);
        log_print(l, message);
    }
}

#define gitsvc_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (int(::gitsvc::log::level::Level) >= int(::gitsvc::log::current_log_level)) {           \
            ::gitsvc::log::log(::gitsvc::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace gitsvc::log
