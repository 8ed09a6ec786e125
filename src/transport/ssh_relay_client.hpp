#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "proxy_client.hpp"

// ProxyClient for a relay host reached over SSH that runs the adb tool and
// holds the device connections itself.
//
//   remote_connect()  ->  adb connect <host:port>
//   devices()         ->  adb devices
//   device.shell(c)   ->  adb -s <serial> shell '<c>'
//
// The SSH session to the relay is opened lazily and reopened after a failure.
// One mutex serializes all relay I/O because availability probes may run
// while a device command is in flight.
class SshRelayClient : public ProxyClient {
public:
    // `transport` defaults to an SshTransport
    SshRelayClient(const ProxyConfig& config, std::optional<KeyPair> key,
                   std::unique_ptr<Transport> transport = nullptr);
    ~SshRelayClient() override;

    Result<void> remote_connect(const std::string& host, int port) override;
    Result<std::vector<std::shared_ptr<ProxyDevice>>> devices() override;
    void close() override;
    std::string server() const override;

    // Run a command on the relay. Transport failures come back as
    // CONNECTION_RESET and drop the relay session.
    ShellResult run(const std::string& command);

private:
    ProxyConfig config_;
    std::optional<KeyPair> key_;
    std::unique_ptr<Transport> transport_;
    bool open_ = false;
    std::mutex mutex_;
};

// Parse `adb devices` output into the serials whose state is "device".
std::vector<std::string> parse_adb_devices(const std::string& output);
