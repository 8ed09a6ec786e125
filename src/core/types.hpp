#pragma once

#include <string>
#include <optional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// A device reachable at host:port
struct DeviceTarget {
    std::string host;
    int port = 5555;
    std::string user = "shell";   // login name for the SSH transport
    int timeout = 10;             // seconds, connect and per-command

    // "host:port"; also the serial a proxy server lists the device under
    std::string str() const { return host + ":" + std::to_string(port); }
};

enum class DeviceClass {
    ANDROID_TV,
    FIRE_TV,
};

// Configuration structures
struct DeviceConfig {
    std::string name;
    DeviceTarget target;
    DeviceClass device_class = DeviceClass::ANDROID_TV;
    std::optional<std::string> key_path;
    bool get_sources = true;
};

// Presence selects the proxy backend
struct ProxyConfig {
    std::string host;
    int port = 22;
    std::string user;
    int timeout = 10;
    std::optional<std::string> key_path;
};

struct PollConfig {
    int interval = 10;   // seconds between refresh() calls
};

struct LogConfig {
    std::string level = "info";
    std::string file;    // empty = <temp>/droidlink.log
};
