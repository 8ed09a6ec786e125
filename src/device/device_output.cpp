#include "device_output.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <iterator>

static std::optional<std::string> field(const std::vector<std::string>& tokens, size_t i) {
    if (i >= tokens.size() || tokens[i] == "-") return std::nullopt;
    return tokens[i];
}

std::optional<UpdateOutput> parse_update_output(const std::string& text) {
    auto lines = split_lines(text);
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return !l.empty(); });
    if (first == lines.end()) return std::nullopt;

    auto tokens = split_whitespace(*first);
    UpdateOutput out;
    out.state_token = tokens[0];
    out.current_app = field(tokens, 1);

    if (auto v = field(tokens, 2)) {
        if (auto n = parse_int(*v)) {
            out.volume = std::clamp(*n, 0, MAX_VOLUME_LEVEL);
        }
    }
    if (auto m = field(tokens, 3)) {
        if (auto n = parse_int(*m)) {
            out.muted = *n > 0;
        }
    }

    for (auto it = first + 1; it != lines.end(); ++it) {
        if (!it->empty()) out.running_apps.push_back(*it);
    }
    return out;
}

std::map<std::string, std::string> parse_properties(const std::string& text) {
    static const char* keys[] = {"serialno", "manufacturer", "model", "sw_version", "wifimac"};

    std::map<std::string, std::string> props;
    auto lines = split_lines(text);
    for (size_t i = 0; i < lines.size() && i < std::size(keys); i++) {
        if (lines[i].empty()) continue;
        std::string value = lines[i];
        if (std::string(keys[i]) == "wifimac") {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }
        props[keys[i]] = value;
    }
    return props;
}

std::string format_status(const DeviceStatus& status) {
    std::string out = fmt::format("state: {}\n",
                                  status.state ? to_string(*status.state) : "unavailable");
    if (status.current_app) {
        out += "app: " + *status.current_app;
        if (status.app_name) out += " (" + *status.app_name + ")";
        out += "\n";
    }
    if (status.volume) {
        out += fmt::format("volume: {}/{}\n", *status.volume, MAX_VOLUME_LEVEL);
    }
    if (status.is_volume_muted) {
        out += fmt::format("muted: {}\n", *status.is_volume_muted ? "yes" : "no");
    }
    if (!status.running_apps.empty()) {
        out += "running:";
        for (const auto& app : status.running_apps) out += " " + app;
        out += "\n";
    }
    return out;
}
