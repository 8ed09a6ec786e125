#pragma once

#include <string>
#include <functional>
#include <fmt/format.h>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

const char* log_level_name(LogLevel level);

// Parse "debug" / "info" / "warning" / "error" (case-insensitive).
// Unknown names fall back to INFO.
LogLevel parse_log_level(const std::string& name);

// Receives every event at or above the threshold, after it is written to file.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Empty path restores the default <temp>/droidlink.log
void set_log_file(const std::string& path);
std::string log_file_path();

// Pass nullptr to remove the sink
void set_log_sink(LogSink sink);

void droidlink_log(LogLevel level, const std::string& msg);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    droidlink_log(LogLevel::DEBUG, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    droidlink_log(LogLevel::INFO, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warning(fmt::format_string<Args...> f, Args&&... args) {
    droidlink_log(LogLevel::WARNING, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    droidlink_log(LogLevel::ERROR, fmt::format(f, std::forward<Args>(args)...));
}
