#include "device_controller.hpp"
#include "keys.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

DeviceController::DeviceController(std::unique_ptr<ConnectionManager> manager,
                                   ControllerOptions options)
    : manager_(std::move(manager)),
      options_(std::move(options)),
      available_(manager_->available()) {
    if (options_.name.empty()) {
        options_.name = manager_->target().str();
    }
}

std::optional<std::string> DeviceController::guarded(const std::function<ShellResult()>& op,
                                                     bool override_available) {
    if (!available_ && !override_available) {
        return std::nullopt;
    }

    ShellResult r = op();
    if (r.ok()) {
        return r.output;
    }

    if (is_recoverable(backend(), r.error)) {
        log_error("Failed to execute a shell command. Connection re-establishing attempt "
                  "in the next update. Error: {} ({})",
                  transport_error_name(r.error), r.message);
        manager_->close();
        available_ = false;
        return std::nullopt;
    }

    throw TransportFault(backend(), r.error, r.message);
}

std::optional<std::string> DeviceController::shell(const std::string& command) {
    return guarded([this, &command] { return manager_->shell(command); });
}

void DeviceController::send_key(const std::string& key) {
    auto code = key_code(key);
    if (!code) {
        throw std::invalid_argument("unknown key: " + key);
    }
    shell(fmt::format(CMD_KEY_EVENT, *code));
}

void DeviceController::mark_unavailable() {
    available_ = false;
    status_ = DeviceStatus{};
}

std::optional<DeviceStatus> DeviceController::build_status(
    const std::optional<std::string>& output) const {
    if (!output) return std::nullopt;

    auto raw = parse_update_output(*output);
    if (!raw) return std::nullopt;

    DeviceState state = translate_state(raw->state_token);
    if (state == DeviceState::UNKNOWN) return std::nullopt;

    DeviceStatus status;
    status.state = state;
    status.current_app = raw->current_app;
    if (status.current_app) {
        auto it = options_.apps.find(*status.current_app);
        if (it != options_.apps.end()) status.app_name = it->second;
    }
    apply_update(*raw, status);
    return status;
}

DeviceStatus DeviceController::refresh() {
    if (!available_) {
        available_ = manager_->connect(false);
        if (!available_) {
            status_ = DeviceStatus{};
            return status_;
        }
        // The direct backend reports state from the next cycle on
        if (backend() == Backend::DIRECT) {
            status_ = DeviceStatus{};
            return status_;
        }
    }

    auto output = guarded([this] { return manager_->shell(update_command()); }, true);
    if (!available_) {
        status_ = DeviceStatus{};
        return status_;
    }

    auto status = build_status(output);
    if (!status) {
        log_warning("Could not determine the state of {} from '{}'; marking it unavailable",
                    options_.name, trimmed(output.value_or("")));
        mark_unavailable();
        return status_;
    }

    if (last_state_ != status->state) {
        log_debug("{}: state {} -> {}", options_.name,
                  last_state_ ? to_string(*last_state_) : "none", to_string(*status->state));
    }
    last_state_ = status->state;
    status_ = std::move(*status);
    return status_;
}

std::optional<DeviceState> DeviceController::state() const {
    if (!available_) return std::nullopt;
    return status_.state;
}

std::optional<std::string> DeviceController::unique_id() const {
    auto it = properties_.find("serialno");
    if (it == properties_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> DeviceController::command(const std::string& identifier) {
    if (key_code(identifier)) {
        last_response_.reset();
        send_key(identifier);
        return std::nullopt;
    }

    if (identifier == CMD_GET_PROPERTIES) {
        auto status = build_status(shell(update_command()));
        if (!status) return std::nullopt;
        last_response_ = format_status(*status);
        return last_response_;
    }

    auto output = shell(identifier);
    if (!output) return std::nullopt;

    std::string stripped = trimmed(*output);
    if (stripped.empty()) {
        last_response_.reset();
        return std::nullopt;
    }
    last_response_ = stripped;
    return last_response_;
}

void DeviceController::turn_on() {
    if (options_.turn_on_command) {
        shell(*options_.turn_on_command);
    } else {
        send_key("WAKEUP");
    }
}

void DeviceController::turn_off() {
    if (options_.turn_off_command) {
        shell(*options_.turn_off_command);
    } else {
        send_key("SLEEP");
    }
}

void DeviceController::media_play()           { send_key("PLAY"); }
void DeviceController::media_pause()          { send_key("PAUSE"); }
void DeviceController::media_play_pause()     { send_key("PLAY_PAUSE"); }
void DeviceController::media_stop()           { send_key("STOP"); }
void DeviceController::media_next_track()     { send_key("NEXT"); }
void DeviceController::media_previous_track() { send_key("PREVIOUS"); }
void DeviceController::volume_up()            { send_key("VOLUME_UP"); }
void DeviceController::volume_down()          { send_key("VOLUME_DOWN"); }
void DeviceController::mute_volume()          { send_key("MUTE"); }

void DeviceController::select_source(const std::string& source) {
    bool stop = !source.empty() && source[0] == '!';
    std::string app = stop ? source.substr(1) : source;

    // Display names resolve to their package
    for (const auto& [package, display] : options_.apps) {
        if (display == app) {
            app = package;
            break;
        }
    }

    if (app.empty()) {
        throw std::invalid_argument("no app given");
    }
    shell(fmt::format(stop ? CMD_STOP_APP : CMD_LAUNCH_APP, shell_quote(app)));
}

std::map<std::string, std::string> DeviceController::fetch_properties() {
    auto output = shell(CMD_DEVICE_PROPERTIES);
    if (output) {
        properties_ = parse_properties(*output);
    }
    return properties_;
}

// ── Android TV ──────────────────────────────────────────────

std::string AndroidTvController::update_command() const {
    return CMD_UPDATE;
}

void AndroidTvController::apply_update(const UpdateOutput& raw, DeviceStatus& status) const {
    status.volume = raw.volume;
    status.is_volume_muted = raw.muted;
}

// ── Fire TV ─────────────────────────────────────────────────

std::string FireTvController::update_command() const {
    std::string cmd = CMD_UPDATE;
    if (options().get_sources) {
        cmd += CMD_RUNNING_APPS;
    }
    return cmd;
}

void FireTvController::apply_update(const UpdateOutput& raw, DeviceStatus& status) const {
    if (options().get_sources) {
        status.running_apps = raw.running_apps;
    }
}
