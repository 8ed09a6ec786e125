#pragma once

#include <memory>
#include <string>
#include <transport/proxy_client.hpp>
#include "connection_manager.hpp"

// Goes through a proxy server that holds the device connection. The device
// is identified on the proxy by its serial, "host:port".
//
// available() never trusts the cached flag: the proxy server can lose the
// device (or die) independently of this process, so every read asks it.
class ProxyConnection : public ConnectionManager {
public:
    ProxyConnection(DeviceTarget target, std::unique_ptr<ProxyClient> client);
    ~ProxyConnection() override;

    Backend backend() const override { return Backend::PROXY; }
    bool available() override;
    std::string describe() const override;

    bool has_device();

protected:
    TransportStatus open_locked() override;
    ShellResult execute_locked(const std::string& command) override;
    void close_locked() override;

private:
    // Declared before device_: device handles may refer back to the client
    std::unique_ptr<ProxyClient> client_;
    std::shared_ptr<ProxyDevice> device_;

    // Look this device up in the proxy's device list. A null value with
    // success means the proxy answered but does not hold the device.
    Result<std::shared_ptr<ProxyDevice>> find_device();
};
