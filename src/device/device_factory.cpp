#include "device_factory.hpp"
#include <connection/connection_factory.hpp>

std::unique_ptr<DeviceController> make_controller(const Config& config,
                                                  std::unique_ptr<ConnectionManager> manager) {
    ControllerOptions options;
    options.name = config.device().name;
    options.apps = config.apps();
    options.turn_on_command = config.turn_on_command();
    options.turn_off_command = config.turn_off_command();
    options.get_sources = config.device().get_sources;

    if (config.device().device_class == DeviceClass::FIRE_TV) {
        return std::make_unique<FireTvController>(std::move(manager), std::move(options));
    }
    return std::make_unique<AndroidTvController>(std::move(manager), std::move(options));
}

std::unique_ptr<DeviceController> start_controller(const Config& config,
                                                   std::unique_ptr<ConnectionManager> manager) {
    bool connected = manager->connect(true);
    auto controller = make_controller(config, std::move(manager));
    if (connected) {
        controller->fetch_properties();
    }
    return controller;
}

Result<std::unique_ptr<DeviceController>> setup_device(const Config& config) {
    using ControllerPtr = std::unique_ptr<DeviceController>;

    auto manager = make_connection(config);
    if (manager.is_err()) {
        return Result<ControllerPtr>::Err(manager.error);
    }
    return Result<ControllerPtr>::Ok(start_controller(config, std::move(manager.value)));
}
