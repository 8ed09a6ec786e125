#include "log.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::atomic<LogLevel> threshold{LogLevel::INFO};
std::string file_override;
LogSink sink;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void set_log_level(LogLevel level) {
    threshold = level;
}

LogLevel log_level() {
    return threshold;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    file_override = path;
}

std::string log_file_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!file_override.empty()) return file_override;
    return (platform::temp_dir() / "droidlink.log").string();
}

void set_log_sink(LogSink s) {
    std::lock_guard<std::mutex> lock(log_mutex);
    sink = std::move(s);
}

void droidlink_log(LogLevel level, const std::string& msg) {
    if (level < threshold.load()) return;

    std::string path = log_file_path();

    LogSink current;
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::ofstream out(path, std::ios::app);
        if (out) {
            out << "[" << timestamp() << "] " << log_level_name(level) << " " << msg << "\n";
        }
        current = sink;
    }

    // Called outside the lock so a sink may log or reconfigure
    if (current) current(level, msg);
}
