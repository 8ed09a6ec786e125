#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(const fs::path& path) : config_path(path) {
    auto config_result = Config::load(config_path);
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail(config_error.empty() ? "Not configured." : config_error);
        std::cout << theme::step("Run 'droidlink init' to create a config.");
        return false;
    }
    return true;
}

bool BaseCLI::require_device() {
    if (!require_config()) {
        return false;
    }
    if (!device) {
        std::cout << theme::fail("No device set up.");
        return false;
    }
    if (!device->available()) {
        std::cout << theme::warn("Device is unavailable; retrying on the next refresh.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Device",  {"status", "refresh", "props", "shell", "key", "launch"}},
        {"Power",   {"on", "off"}},
        {"Media",   {"play", "pause", "toggle", "stop", "next", "prev"}},
        {"Volume",  {"volup", "voldown", "mute"}},
        {"General", {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::SLATE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::GREEN_BRAND
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::GREEN_BRAND) + "droidlink" + rl_esc(theme::color::RESET);
    if (!config.has_value() || !device) {
        return prompt + "> ";
    }

    prompt += ":" + rl_esc(theme::color::SLATE) + device->name() + rl_esc(theme::color::RESET);
    if (!device->available()) {
        prompt += rl_esc(theme::color::RED) + " (offline)" + rl_esc(theme::color::RESET);
    } else if (auto state = device->state()) {
        prompt += "@" + rl_esc(theme::color::GREEN) + to_string(*state) + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
