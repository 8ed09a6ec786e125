#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <connection/connection_manager.hpp>
#include "device_output.hpp"
#include "device_state.hpp"

struct ControllerOptions {
    std::string name;
    std::map<std::string, std::string> apps;      // package -> display name
    std::optional<std::string> turn_on_command;
    std::optional<std::string> turn_off_command;
    bool get_sources = true;
};

// Polls one device and runs commands on it, hiding connection loss.
//
// While unavailable, commands are no-ops and the next refresh() attempts to
// reconnect. A recoverable transport error (see is_recoverable) closes the
// connection and makes the controller unavailable; any other error kind is a
// defect and is thrown as TransportFault.
class DeviceController {
public:
    DeviceController(std::unique_ptr<ConnectionManager> manager, ControllerOptions options);
    virtual ~DeviceController() = default;

    DeviceController(const DeviceController&) = delete;
    DeviceController& operator=(const DeviceController&) = delete;

    virtual DeviceClass device_class() const = 0;

    // One poll cycle. The returned status has no state while unavailable.
    DeviceStatus refresh();

    // A key name sends that key and returns nothing. GET_PROPERTIES returns
    // the current status as text. Anything else runs as a shell command and
    // returns its stripped output.
    std::optional<std::string> command(const std::string& identifier);

    void turn_on();
    void turn_off();
    void media_play();
    void media_pause();
    void media_play_pause();
    void media_stop();
    void media_next_track();
    void media_previous_track();
    void volume_up();
    void volume_down();
    void mute_volume();

    // Launch by package or configured display name; a leading '!' stops it
    void select_source(const std::string& source);

    // serialno, manufacturer, model, sw_version, wifimac
    std::map<std::string, std::string> fetch_properties();

    bool available() const { return available_; }
    std::optional<DeviceState> state() const;
    const DeviceStatus& status() const { return status_; }
    const std::map<std::string, std::string>& properties() const { return properties_; }
    std::optional<std::string> unique_id() const;
    const std::optional<std::string>& last_response() const { return last_response_; }
    const std::string& name() const { return options_.name; }
    Backend backend() const { return manager_->backend(); }
    ConnectionManager& manager() { return *manager_; }
    const ConnectionManager& manager() const { return *manager_; }

protected:
    virtual std::string update_command() const = 0;

    // Copy the class-specific fields of `raw` into `status`
    virtual void apply_update(const UpdateOutput& raw, DeviceStatus& status) const = 0;

    // Run `op` unless unavailable (or overridden). Returns its output.
    std::optional<std::string> guarded(const std::function<ShellResult()>& op,
                                       bool override_available = false);

    std::optional<std::string> shell(const std::string& command);
    void send_key(const std::string& key);

    const ControllerOptions& options() const { return options_; }

private:
    std::unique_ptr<ConnectionManager> manager_;
    ControllerOptions options_;
    bool available_;
    DeviceStatus status_;
    std::optional<DeviceState> last_state_;
    std::map<std::string, std::string> properties_;
    std::optional<std::string> last_response_;

    std::optional<DeviceStatus> build_status(const std::optional<std::string>& output) const;
    void mark_unavailable();
};

class AndroidTvController : public DeviceController {
public:
    using DeviceController::DeviceController;

    DeviceClass device_class() const override { return DeviceClass::ANDROID_TV; }

protected:
    std::string update_command() const override;
    void apply_update(const UpdateOutput& raw, DeviceStatus& status) const override;
};

class FireTvController : public DeviceController {
public:
    using DeviceController::DeviceController;

    DeviceClass device_class() const override { return DeviceClass::FIRE_TV; }

protected:
    std::string update_command() const override;
    void apply_update(const UpdateOutput& raw, DeviceStatus& status) const override;
};
