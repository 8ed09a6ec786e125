#pragma once

#include <memory>
#include <core/config.hpp>
#include "device_controller.hpp"

// Controller for the configured device class, taking ownership of `manager`
std::unique_ptr<DeviceController> make_controller(const Config& config,
                                                  std::unique_ptr<ConnectionManager> manager);

// First connect on `manager`; on success the device properties (and so
// unique_id()) are read once before the controller is returned.
std::unique_ptr<DeviceController> start_controller(const Config& config,
                                                   std::unique_ptr<ConnectionManager> manager);

// Build the connection, attempt the first connect and wrap it in a
// controller. A failed first connect still yields a controller, which
// keeps retrying from refresh().
Result<std::unique_ptr<DeviceController>> setup_device(const Config& config);
