#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from ~/.droidlink/config.yaml or an explicit path
    static Result<Config> load(const fs::path& path = get_config_path());

    // Parse YAML text directly
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const DeviceConfig& device() const { return device_; }
    const std::optional<ProxyConfig>& proxy() const { return proxy_; }
    const PollConfig& poll() const { return poll_; }
    const LogConfig& log() const { return log_; }

    // package -> display name
    const std::map<std::string, std::string>& apps() const { return apps_; }

    const std::optional<std::string>& turn_on_command() const { return turn_on_command_; }
    const std::optional<std::string>& turn_off_command() const { return turn_off_command_; }

    static fs::path get_config_dir();
    static fs::path get_config_path();

public:
    Config() = default;

private:
    DeviceConfig device_;
    std::optional<ProxyConfig> proxy_;
    PollConfig poll_;
    LogConfig log_;
    std::map<std::string, std::string> apps_;
    std::optional<std::string> turn_on_command_;
    std::optional<std::string> turn_off_command_;

    friend class ConfigBuilder;
};

bool config_exists(const fs::path& path = Config::get_config_path());

// Write a commented default config; leaves an existing file untouched
Result<void> create_default_config(const fs::path& path = Config::get_config_path());
