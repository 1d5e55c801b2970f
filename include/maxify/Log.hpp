/**
 * @file Log.hpp
 * @brief Process-wide leveled logging
 *
 * Messages are formatted with {fmt} and written as
 * "[YYYY-mm-dd HH:MM:SS][LEVEL] message" to stderr, or handed to a
 * replacement sink installed with set_log_sink().
 *
 * ```cpp
 * maxify::set_log_level(maxify::LogLevel::Info);
 * maxify::log_info("Imported {} project(s)", count);
 * ```
 */

#ifndef MAXIFY_LOG_HPP
#define MAXIFY_LOG_HPP

#include <fmt/format.h>

#include <functional>
#include <string>
#include <utility>

namespace maxify {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/**
 * @brief Receives every message at or above the current level
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * @brief Parse "debug", "info", "warn"/"warning", "error" or "off"
 * @throws ConfigError for unknown text
 */
LogLevel parse_log_level(const std::string& text);

/**
 * @brief Lower-case name of a level ("warn")
 */
std::string log_level_name(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

void set_log_sink(LogSink sink);
void reset_log_sink();

/**
 * @brief Render a line with timestamp and level prefix
 */
std::string format_log_line(LogLevel level, const std::string& message);

/**
 * @brief Send an already formatted message to the sink if enabled
 */
void log_message(LogLevel level, const std::string& message);

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Debug)) {
        log_message(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Info)) {
        log_message(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Warn)) {
        log_message(LogLevel::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Error)) {
        log_message(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace maxify

#endif // MAXIFY_LOG_HPP
