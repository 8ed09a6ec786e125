#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <core/credentials.hpp>
#include "connection_manager.hpp"

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

// Talks to the device directly through a Transport created fresh on every
// connect(). With a key path configured, the key pair is loaded (or
// generated) before each connection attempt; a failed generation is not
// retried until a key shows up at the path.
class DirectConnection : public ConnectionManager {
public:
    // `factory` defaults to creating an SshTransport
    DirectConnection(DeviceTarget target,
                     std::optional<std::string> key_path = std::nullopt,
                     TransportFactory factory = nullptr,
                     KeyGenerator generator = generate_key_pair);
    ~DirectConnection() override;

    Backend backend() const override { return Backend::DIRECT; }
    bool available() override { return connected(); }

    bool has_transport();

protected:
    TransportStatus open_locked() override;
    ShellResult execute_locked(const std::string& command) override;
    void close_locked() override;

private:
    std::optional<std::string> key_path_;
    TransportFactory factory_;
    KeyGenerator generator_;
    bool generation_failed_ = false;
    std::unique_ptr<Transport> transport_;
};
