#include "droidlink_cli.hpp"
#include "theme.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <fmt/format.h>
#include <core/log.hpp>
#include <device/device_factory.hpp>
#include <platform/platform.hpp>
#include <readline/readline.h>
#include <readline/history.h>

static std::atomic<bool> g_interrupted{false};

static void on_sigint(int) {
    g_interrupted = true;
}

DroidlinkCLI::DroidlinkCLI(const fs::path& path) : BaseCLI(path) {
    register_all_commands();
}

DroidlinkCLI::~DroidlinkCLI() {
    set_log_sink(nullptr);
}

void DroidlinkCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Disconnect and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Disconnect and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_device_commands(*this);
    register_media_commands(*this);
}

void DroidlinkCLI::setup_logging() {
    if (config) {
        set_log_level(parse_log_level(config->log().level));
        set_log_file(config->log().file);
    }
    set_log_sink([](LogLevel level, const std::string& msg) {
        if (level == LogLevel::ERROR) {
            std::cout << theme::fail(msg);
        } else if (level == LogLevel::WARNING) {
            std::cout << theme::warn(msg);
        } else if (level == LogLevel::INFO) {
            std::cout << theme::log(msg);
        }
    });
}

bool DroidlinkCLI::setup_device_controller() {
    if (!require_config()) {
        return false;
    }
    setup_logging();

    std::cout << theme::section("Connecting");
    std::cout << theme::kv("Device", config->device().name);
    std::cout << theme::kv("Target", config->device().target.str());
    if (config->proxy()) {
        std::cout << theme::kv("Proxy", fmt::format("{}:{}", config->proxy()->host, config->proxy()->port));
    }

    auto result = setup_device(config.value());
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    device = std::move(result.value);

    if (device->available()) {
        device->refresh();
        last_refresh_ = std::chrono::steady_clock::now();
    } else {
        std::cout << theme::step("Retrying on every refresh.");
    }
    return true;
}

void DroidlinkCLI::refresh_if_due() {
    if (!device || !config) return;
    auto now = std::chrono::steady_clock::now();
    if (now - last_refresh_ >= std::chrono::seconds(config->poll().interval)) {
        last_refresh_ = now;
        device->refresh();
    }
}

void DroidlinkCLI::run_connected_repl() {
    std::cout << theme::banner();
    if (!setup_device_controller()) {
        std::cout << "\n";
        return;
    }

    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (true) {
        // Poll throttled to the configured interval
        refresh_if_due();

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
        if (quit_requested_) {
            break;
        }
    }

    std::cout << theme::dim("    Disconnecting...") << "\n";
    if (device) {
        device->manager().close();
        device.reset();
    }
}

int DroidlinkCLI::run_watch() {
    std::cout << theme::banner();
    if (!setup_device_controller()) {
        return 1;
    }

    g_interrupted = false;
    std::signal(SIGINT, on_sigint);

    std::cout << theme::section("Watching");
    std::cout << theme::dim(fmt::format("    Polling every {}s, Ctrl-C to stop.",
                                        config->poll().interval)) << "\n\n";

    std::optional<DeviceState> last;
    std::optional<std::string> last_app;
    bool first = true;

    while (!g_interrupted) {
        auto status = device->refresh();
        if (first || status.state != last || status.current_app != last_app) {
            std::string state = status.state ? to_string(*status.state) : "unavailable";
            std::string app = status.app_name ? *status.app_name : status.current_app.value_or("");
            std::cout << theme::kv(state, app);
            last = status.state;
            last_app = status.current_app;
            first = false;
        }

        // Sleep in slices so Ctrl-C is handled promptly
        for (int i = 0; i < config->poll().interval * 10 && !g_interrupted; i++) {
            platform::sleep_ms(100);
        }
    }

    std::signal(SIGINT, SIG_DFL);
    std::cout << "\n" << theme::dim("    Stopped.") << "\n";
    device->manager().close();
    return 0;
}

int DroidlinkCLI::run_status() {
    if (!setup_device_controller()) {
        return 1;
    }
    if (device->available()) {
        // The direct backend needs one more cycle after a fresh connect
        if (!device->state()) device->refresh();
    }
    execute_command("status");
    device->manager().close();
    return device->available() ? 0 : 2;
}

int DroidlinkCLI::run_init() {
    std::cout << theme::banner();
    std::cout << theme::section("Setup");

    if (config_exists(config_path)) {
        std::cout << theme::info("Config already exists at " + config_path.string());
        return 0;
    }

    auto result = create_default_config(config_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    std::cout << theme::ok("Wrote " + config_path.string());
    std::cout << theme::step("Set device.host, then run 'droidlink' to connect.");
    std::cout << "\n";
    return 0;
}
