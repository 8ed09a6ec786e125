#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <device/device_controller.hpp>

class BaseCLI {
public:
    explicit BaseCLI(const fs::path& config_path = Config::get_config_path());
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_device();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    fs::path config_path;
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<DeviceController> device;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
