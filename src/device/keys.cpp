#include "keys.hpp"

const std::map<std::string, int>& key_codes() {
    static const std::map<std::string, int> codes = {
        {"HOME",        3},
        {"BACK",        4},
        {"UP",          19},
        {"DOWN",        20},
        {"LEFT",        21},
        {"RIGHT",       22},
        {"CENTER",      23},
        {"VOLUME_UP",   24},
        {"VOLUME_DOWN", 25},
        {"POWER",       26},
        {"ENTER",       66},
        {"MENU",        82},
        {"SEARCH",      84},
        {"PLAY_PAUSE",  85},
        {"STOP",        86},
        {"NEXT",        87},
        {"PREVIOUS",    88},
        {"REWIND",      89},
        {"FAST_FORWARD",90},
        {"PLAY",        126},
        {"PAUSE",       127},
        {"MUTE",        164},
        {"SETTINGS",    176},
        {"SLEEP",       223},
        {"WAKEUP",      224},
    };
    return codes;
}

std::optional<int> key_code(const std::string& name) {
    const auto& codes = key_codes();
    auto it = codes.find(name);
    if (it == codes.end()) return std::nullopt;
    return it->second;
}
