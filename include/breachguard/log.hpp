// log.hpp
#ifndef BREACHGUARD_LOG_HPP
#define BREACHGUARD_LOG_HPP

#include <atomic>      // For std::atomic
#include <cstdint>     // For std::uint8_t
#include <cstdio>      // For stderr
#include <optional>    // For std::optional
#include <string_view> // For std::string_view
#include <utility>     // For std::forward, std::to_underlying

#include <fmt/format.h>

namespace breachguard {

/// @brief Diagnostic severity; messages below the process threshold are dropped.
enum class LogLevel : std::uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

namespace detail {

inline std::atomic<LogLevel> log_threshold{LogLevel::WARN};

[[nodiscard]] constexpr auto level_tag(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF: break;
    }
    return "off";
}

} // namespace detail

inline void set_log_level(LogLevel level) noexcept {
    detail::log_threshold.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline auto log_level() noexcept -> LogLevel {
    return detail::log_threshold.load(std::memory_order_relaxed);
}

/// @brief Parses "debug", "info", "warn", "error" or "off".
[[nodiscard]] constexpr auto parse_log_level(std::string_view name) noexcept -> std::optional<LogLevel> {
    for (const auto level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::OFF}) {
        if (detail::level_tag(level) == name) {
            return level;
        }
    }
    return std::nullopt;
}

/// @brief Writes one formatted line to stderr if `level` passes the threshold.
/// Never pass a password, a digest or a digest suffix as an argument.
template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level == LogLevel::OFF ||
        std::to_underlying(level) < std::to_underlying(log_level())) {
        return;
    }
    fmt::print(stderr, "[breachguard:{}] {}\n", detail::level_tag(level),
               fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::INFO, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::WARN, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::ERROR, format, std::forward<Args>(args)...);
}

} // namespace breachguard

#endif // BREACHGUARD_LOG_HPP
