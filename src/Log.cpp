/**
 * @file Log.cpp
 * @brief Implementation of leveled logging
 */

#include "maxify/Log.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Util.hpp"

#include <cctype>
#include <ctime>
#include <iostream>

namespace maxify {

namespace {

    LogLevel g_level = LogLevel::Warn;

    std::string timestamp_now() {
        char buf[64];
        std::time_t t = std::time(nullptr);
        std::tm tmv;
#ifdef _WIN32
        localtime_s(&tmv, &t);
#else
        localtime_r(&t, &tmv);
#endif
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
        return std::string(buf);
    }

    void stderr_sink(LogLevel level, const std::string& message) {
        std::cerr << format_log_line(level, message) << std::endl;
    }

    LogSink& current_sink() {
        static LogSink sink = stderr_sink;
        return sink;
    }
}

LogLevel parse_log_level(const std::string& text) {
    const std::string lower = to_lower(trim(text));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    throw ConfigError("Unknown log level: '" + text + "'");
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && level >= g_level;
}

void set_log_sink(LogSink sink) {
    if (sink) {
        current_sink() = std::move(sink);
    } else {
        current_sink() = stderr_sink;
    }
}

void reset_log_sink() {
    current_sink() = stderr_sink;
}

std::string format_log_line(LogLevel level, const std::string& message) {
    std::string name = log_level_name(level);
    for (auto& c : name) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return fmt::format("[{}][{}] {}", timestamp_now(), name, message);
}

void log_message(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }
    current_sink()(level, message);
}

} // namespace maxify
