#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <device/keys.hpp>

static void print_status(const DeviceController& device) {
    const auto& s = device.status();
    std::cout << theme::kv("Device", device.name());
    std::cout << theme::kv("Target", device.manager().describe());
    std::cout << theme::kv("Backend", backend_name(device.backend()));

    if (!device.available()) {
        std::cout << theme::kv("State", theme::red("unavailable"));
        return;
    }

    auto state = device.state();
    std::cout << theme::kv("State", state ? theme::green(to_string(*state)) : theme::dim("not polled yet"));
    if (s.current_app) {
        std::cout << theme::kv("App", s.app_name ? *s.app_name + theme::dim(" " + *s.current_app)
                                                 : *s.current_app);
    }
    if (s.volume) {
        std::string vol = fmt::format("{}/{}", *s.volume, MAX_VOLUME_LEVEL);
        if (s.is_volume_muted && *s.is_volume_muted) vol += theme::dim(" (muted)");
        std::cout << theme::kv("Volume", vol);
    }
    if (!s.running_apps.empty()) {
        std::cout << theme::kv("Running", std::to_string(s.running_apps.size()) + " apps");
        for (const auto& app : s.running_apps) {
            std::cout << theme::log(app);
        }
    }
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    std::cout << theme::section("Status");
    if (!cli.device) {
        std::cout << theme::fail("No device set up.");
        return;
    }
    print_status(*cli.device);
    std::cout << "\n";
}

static void do_refresh(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config() || !cli.device) return;
    cli.device->refresh();
    print_status(*cli.device);
}

static void do_key(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_device()) return;
    std::string name = trimmed(arg);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name.empty() || !key_code(name)) {
        std::cout << theme::fail(name.empty() ? "Usage: key <name>" : "Unknown key: " + name);
        std::string names;
        for (const auto& [k, code] : key_codes()) {
            if (!names.empty()) names += ", ";
            names += k;
        }
        std::cout << theme::step("Keys: " + names);
        return;
    }
    cli.device->command(name);
}

static void do_shell(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_device()) return;
    if (trimmed(arg).empty()) {
        std::cout << "Usage: shell <command>\n";
        return;
    }
    auto output = cli.device->command(arg);
    if (output) {
        std::cout << *output << "\n";
    }
}

static void do_props(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_device()) return;
    auto props = cli.device->fetch_properties();
    std::cout << theme::section("Properties");
    if (props.empty()) {
        std::cout << theme::fail("No properties returned.");
        return;
    }
    for (const auto& [key, value] : props) {
        std::cout << theme::kv(key, value);
    }
    std::cout << "\n";
}

static void do_launch(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_device()) return;
    std::string app = trimmed(arg);
    if (app.empty()) {
        std::cout << "Usage: launch <package|name>   (prefix with ! to stop)\n";
        if (cli.config && !cli.config->apps().empty()) {
            for (const auto& [package, name] : cli.config->apps()) {
                std::cout << theme::kv(name, package);
            }
        }
        return;
    }
    cli.device->select_source(app);
    std::cout << theme::ok((app[0] == '!' ? "Stopped " + app.substr(1) : "Launched " + app));
}

void register_device_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show the last polled device status");
    cli.add_command("refresh", do_refresh, "Poll the device now");
    cli.add_command("key", do_key, "Send a key event (key HOME, key BACK, ...)");
    cli.add_command("shell", do_shell, "Run a shell command on the device");
    cli.add_command("props", do_props, "Show device properties");
    cli.add_command("launch", do_launch, "Launch or stop an app");
}
