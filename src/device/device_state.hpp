#pragma once

#include <string>

enum class DeviceState {
    OFF,
    IDLE,
    STANDBY,
    PLAYING,
    PAUSED,
    UNKNOWN,
};

// Map a device-reported state token to a DeviceState. Anything outside the
// known tokens is UNKNOWN, which callers treat as a failed translation.
DeviceState translate_state(const std::string& token);

const char* to_string(DeviceState state);
