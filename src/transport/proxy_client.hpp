#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "transport.hpp"

// A device held by a proxy server
class ProxyDevice {
public:
    virtual ~ProxyDevice() = default;

    virtual Result<std::string> serial_no() = 0;

    // Errors are reported as CONNECTION_RESET (proxy link lost) or
    // RPC_FAILURE (the proxy server refused or failed the request).
    virtual ShellResult shell(const std::string& command) = 0;
};

// Client for a proxy server that owns the device connections
class ProxyClient {
public:
    virtual ~ProxyClient() = default;

    // Ask the proxy server to connect to host:port. Success does not mean the
    // device is usable yet; it must also show up in devices().
    virtual Result<void> remote_connect(const std::string& host, int port) = 0;

    // Devices the proxy server currently holds
    virtual Result<std::vector<std::shared_ptr<ProxyDevice>>> devices() = 0;

    virtual void close() = 0;

    // "host:port" of the proxy server, for log messages
    virtual std::string server() const = 0;
};
