#include "proxy_connection.hpp"
#include <core/log.hpp>

ProxyConnection::ProxyConnection(DeviceTarget target, std::unique_ptr<ProxyClient> client)
    : ConnectionManager(std::move(target)), client_(std::move(client)) {
}

ProxyConnection::~ProxyConnection() {
    std::lock_guard<std::mutex> lock(lock_);
    device_.reset();
}

std::string ProxyConnection::describe() const {
    return target_.str() + " via proxy server " + client_->server();
}

Result<std::shared_ptr<ProxyDevice>> ProxyConnection::find_device() {
    using DevicePtr = std::shared_ptr<ProxyDevice>;

    auto list = client_->devices();
    if (list.is_err()) {
        return Result<DevicePtr>::Err("proxy server is unavailable: " + list.error);
    }

    std::string serial = target_.str();
    for (const auto& dev : list.value) {
        auto s = dev->serial_no();
        if (s.is_err()) {
            return Result<DevicePtr>::Err("error while searching for the device: " + s.error);
        }
        if (s.value == serial) {
            return Result<DevicePtr>::Ok(dev);
        }
    }
    return Result<DevicePtr>::Ok(nullptr);
}

TransportStatus ProxyConnection::open_locked() {
    // Not fatal: the proxy may already hold the device
    auto rc = client_->remote_connect(target_.host, target_.port);
    if (rc.is_err()) {
        log_debug("proxy remote_connect {}: {}", target_.str(), rc.error);
    }

    auto found = find_device();
    if (found.is_err()) {
        return TransportStatus::Err(TransportError::RPC_FAILURE, found.error);
    }
    if (!found.value) {
        return TransportStatus::Err(TransportError::RPC_FAILURE,
                                    "proxy server does not hold " + target_.str());
    }
    device_ = found.value;
    return TransportStatus::Ok();
}

ShellResult ProxyConnection::execute_locked(const std::string& command) {
    if (!device_) {
        return ShellResult::Err(TransportError::CONNECTION_RESET, "No device handle");
    }
    log_debug("shell {}: {}", describe(), command);
    return device_->shell(command);
}

void ProxyConnection::close_locked() {
    device_.reset();
    client_->close();
}

bool ProxyConnection::available() {
    auto found = find_device();
    bool held = found.is_ok() && found.value;

    // While connect() or a command holds the lock, report the probe and leave
    // the state to the lock holder
    std::unique_lock<std::mutex> lock(lock_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return held;
    }

    if (!held) {
        if (connected_) {
            if (found.is_err()) {
                log_error("{} is unavailable; {}", describe(), found.error);
            } else {
                log_error("Proxy server {} is not connected to {}", client_->server(), target_.str());
            }
        }
        device_.reset();
        connected_ = false;
        return false;
    }

    if (!device_) {
        device_ = found.value;
    }
    connected_ = true;
    return true;
}

bool ProxyConnection::has_device() {
    std::lock_guard<std::mutex> lock(lock_);
    return device_ != nullptr;
}
