#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path Config::get_config_dir() {
    return platform::home_dir() / ".droidlink";
}

fs::path Config::get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# droidlink configuration

device:
  name: "Living Room TV"
  host: "192.168.1.50"
  port: 5555
  class: androidtv                 # androidtv | firetv
  user: "shell"
  key_path: "~/.droidlink/device_key"
  timeout: 10                      # seconds, connect and per-command
  get_sources: true                # Fire TV: report running apps

# Optional: reach the device through a relay host running adb
# proxy:
#   host: "relay.local"
#   port: 22
#   user: "pi"
#   key_path: "~/.ssh/id_rsa"

poll:
  interval: 10

# Optional: replace the default power key events
# turn_on_command: "input keyevent 224"
# turn_off_command: "input keyevent 223"

# Package name -> display name
apps:
  com.netflix.ninja: "Netflix"
  com.google.android.youtube.tv: "YouTube"

log:
  level: info                      # debug | info | warning | error
  # file: "/tmp/droidlink.log"
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static std::optional<std::string> optional_path(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return std::nullopt;
    std::string value = node.as<std::string>("");
    if (value.empty()) return std::nullopt;
    return expand_user(value);
}

static DeviceClass parse_device_class(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    lower.erase(std::remove_if(lower.begin(), lower.end(),
                               [](char c) { return c == '_' || c == '-' || c == ' '; }),
                lower.end());
    if (lower == "firetv") return DeviceClass::FIRE_TV;
    if (lower == "androidtv") return DeviceClass::ANDROID_TV;
    throw std::runtime_error("unknown device class '" + value + "' (expected androidtv or firetv)");
}

static DeviceConfig parse_device_config(const YAML::Node& node) {
    DeviceConfig device;
    device.target.host = node["host"].as<std::string>("");
    if (device.target.host.empty()) {
        throw std::runtime_error("device.host is required");
    }
    device.target.port = node["port"].as<int>(DEFAULT_DEVICE_PORT);
    device.target.user = node["user"].as<std::string>("shell");
    device.target.timeout = node["timeout"].as<int>(DEFAULT_TIMEOUT_SECS);
    device.name = node["name"].as<std::string>(device.target.host);
    device.device_class = parse_device_class(node["class"].as<std::string>("androidtv"));
    device.key_path = optional_path(node["key_path"]);
    device.get_sources = node["get_sources"].as<bool>(true);
    return device;
}

static ProxyConfig parse_proxy_config(const YAML::Node& node) {
    ProxyConfig proxy;
    proxy.host = node["host"].as<std::string>("");
    if (proxy.host.empty()) {
        throw std::runtime_error("proxy.host is required when a proxy section is present");
    }
    proxy.port = node["port"].as<int>(DEFAULT_PROXY_PORT);
    proxy.user = node["user"].as<std::string>("");
    proxy.timeout = node["timeout"].as<int>(DEFAULT_TIMEOUT_SECS);
    proxy.key_path = optional_path(node["key_path"]);
    return proxy;
}

// Fills the private members from a parsed document
class ConfigBuilder {
public:
    static Config build(const YAML::Node& root) {
        if (!root["device"] || !root["device"].IsMap()) {
            throw std::runtime_error("missing 'device' section");
        }

        Config config;
        config.device_ = parse_device_config(root["device"]);

        if (root["proxy"] && root["proxy"].IsMap()) {
            config.proxy_ = parse_proxy_config(root["proxy"]);
        }

        if (root["poll"] && root["poll"].IsMap()) {
            config.poll_.interval = root["poll"]["interval"].as<int>(DEFAULT_POLL_INTERVAL_SECS);
        }
        if (config.poll_.interval <= 0) {
            config.poll_.interval = DEFAULT_POLL_INTERVAL_SECS;
        }

        if (root["log"] && root["log"].IsMap()) {
            config.log_.level = root["log"]["level"].as<std::string>("info");
            config.log_.file = expand_user(root["log"]["file"].as<std::string>(""));
        }

        if (root["apps"] && root["apps"].IsMap()) {
            for (const auto& kv : root["apps"]) {
                config.apps_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }

        if (root["turn_on_command"] && root["turn_on_command"].IsScalar()) {
            config.turn_on_command_ = root["turn_on_command"].as<std::string>();
        }
        if (root["turn_off_command"] && root["turn_off_command"].IsScalar()) {
            config.turn_off_command_ = root["turn_off_command"].as<std::string>();
        }

        return config;
    }
};

static Config build_config(const YAML::Node& root) {
    return ConfigBuilder::build(root);
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string() +
                                   " (run 'droidlink init' to create one)");
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Config>::Ok(build_config(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return Result<Config>::Ok(build_config(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}
