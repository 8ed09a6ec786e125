#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <transport/transport.hpp>

// Owns the link to one device and serializes commands over it.
//
// Exactly two variants exist: DirectConnection (talks to the device through a
// Transport) and ProxyConnection (goes through a proxy server holding the
// device). The variant is picked once, at construction.
//
// The command lock is taken without blocking in shell(): while one command is
// in flight every other shell() call returns no output immediately instead of
// queueing. connect() and close() wait for the in-flight command, which is
// bounded by the transport's own I/O timeout.
class ConnectionManager {
public:
    explicit ConnectionManager(DeviceTarget target);
    virtual ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    virtual Backend backend() const = 0;

    // Tear down any previous link and establish a new one. Never throws for
    // connectivity failures. A failure is logged unless always_log_errors is
    // false and one was already logged since the last success.
    bool connect(bool always_log_errors = true);

    // Run a command. No output when disconnected or when another command is
    // in flight; a failed result marks the manager disconnected.
    ShellResult shell(const std::string& command);

    // Best-effort teardown; always leaves the manager disconnected.
    void close();

    // Direct: the connected flag. Proxy: a live check against the proxy server.
    virtual bool available() = 0;

    bool connected() const { return connected_; }
    const DeviceTarget& target() const { return target_; }

    // Connection target for log messages
    virtual std::string describe() const;

protected:
    // Called with lock_ held
    virtual TransportStatus open_locked() = 0;
    virtual ShellResult execute_locked(const std::string& command) = 0;
    virtual void close_locked() = 0;

    DeviceTarget target_;
    std::mutex lock_;
    std::atomic<bool> connected_{false};

private:
    bool failure_reported_ = false;
};
