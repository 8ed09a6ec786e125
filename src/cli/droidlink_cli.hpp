#pragma once

#include "base_cli.hpp"
#include <string>
#include <chrono>

// Forward declarations for command registration
void register_device_commands(BaseCLI& cli);
void register_media_commands(BaseCLI& cli);

class DroidlinkCLI : public BaseCLI {
public:
    explicit DroidlinkCLI(const fs::path& config_path = Config::get_config_path());
    ~DroidlinkCLI() override;

    void run_connected_repl();
    int run_watch();
    int run_status();
    int run_init();

private:
    void register_all_commands();

    // Apply log settings and echo warnings/errors to the terminal
    void setup_logging();

    // Build the controller and make the first connection attempt
    bool setup_device_controller();

    // Poll when at least one interval has passed since the last poll
    void refresh_if_due();

    std::chrono::steady_clock::time_point last_refresh_{};
    bool quit_requested_ = false;
};
