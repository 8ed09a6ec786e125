#include "device_state.hpp"
#include <map>

DeviceState translate_state(const std::string& token) {
    static const std::map<std::string, DeviceState> table = {
        {"off",     DeviceState::OFF},
        {"idle",    DeviceState::IDLE},
        {"standby", DeviceState::STANDBY},
        {"playing", DeviceState::PLAYING},
        {"paused",  DeviceState::PAUSED},
    };

    auto it = table.find(token);
    return it != table.end() ? it->second : DeviceState::UNKNOWN;
}

const char* to_string(DeviceState state) {
    switch (state) {
        case DeviceState::OFF:     return "off";
        case DeviceState::IDLE:    return "idle";
        case DeviceState::STANDBY: return "standby";
        case DeviceState::PLAYING: return "playing";
        case DeviceState::PAUSED:  return "paused";
        case DeviceState::UNKNOWN: return "unknown";
    }
    return "unknown";
}
