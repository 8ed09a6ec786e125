#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>

// Each command maps straight onto a controller call
static void add_action(BaseCLI& cli, const std::string& name,
                       void (DeviceController::*action)(),
                       const std::string& help) {
    cli.add_command(name, [action](BaseCLI& cli, const std::string& arg) {
        if (!cli.require_device()) return;
        ((*cli.device).*action)();
    }, help);
}

void register_media_commands(BaseCLI& cli) {
    add_action(cli, "on",      &DeviceController::turn_on,              "Turn the device on");
    add_action(cli, "off",     &DeviceController::turn_off,             "Turn the device off");
    add_action(cli, "play",    &DeviceController::media_play,           "Play");
    add_action(cli, "pause",   &DeviceController::media_pause,          "Pause");
    add_action(cli, "toggle",  &DeviceController::media_play_pause,     "Toggle play/pause");
    add_action(cli, "stop",    &DeviceController::media_stop,           "Stop playback");
    add_action(cli, "next",    &DeviceController::media_next_track,     "Next track");
    add_action(cli, "prev",    &DeviceController::media_previous_track, "Previous track");
    add_action(cli, "volup",   &DeviceController::volume_up,            "Volume up");
    add_action(cli, "voldown", &DeviceController::volume_down,          "Volume down");
    add_action(cli, "mute",    &DeviceController::mute_volume,          "Toggle mute");
}
