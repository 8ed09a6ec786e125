#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "device_state.hpp"

// Snapshot produced by one refresh()
struct DeviceStatus {
    std::optional<DeviceState> state;
    std::optional<std::string> current_app;   // package name
    std::optional<std::string> app_name;      // display name from the apps map
    std::optional<int> volume;                // 0..MAX_VOLUME_LEVEL
    std::optional<bool> is_volume_muted;
    std::vector<std::string> running_apps;
};

// Fields of the update command's output, before state translation
struct UpdateOutput {
    std::string state_token;
    std::optional<std::string> current_app;
    std::optional<int> volume;
    std::optional<bool> muted;
    std::vector<std::string> running_apps;   // lines after the first
};

// First line: "<state> <app> <volume> <muted>" where "-" marks a missing
// field and trailing fields may be absent. Every further non-empty line is a
// running app. Empty or blank text yields nothing.
std::optional<UpdateOutput> parse_update_output(const std::string& text);

// One value per line in the order of CMD_DEVICE_PROPERTIES. Keys:
// serialno, manufacturer, model, sw_version, wifimac. Missing or empty
// lines are left out.
std::map<std::string, std::string> parse_properties(const std::string& text);

// Multi-line human readable status
std::string format_status(const DeviceStatus& status);
