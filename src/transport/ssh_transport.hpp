#pragma once

#include <chrono>
#include <string>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Remote shell over SSH. One session per open(); every execute() runs on a
// fresh exec channel (no PTY), so output is binary-clean and the exit status
// is available. All libssh2 calls are non-blocking and bounded by the
// target's timeout.
class SshTransport : public Transport {
public:
    SshTransport();
    ~SshTransport() override;

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

    TransportStatus open(const DeviceTarget& target, const KeyPair* key) override;
    ShellResult execute(const std::string& command) override;
    void close() override;

private:
    using Clock = std::chrono::steady_clock;

    LIBSSH2_SESSION* session_;
    socket_t sock_;
    int timeout_secs_;
    std::string target_str_;

    TransportStatus authenticate(const DeviceTarget& target, const KeyPair* key,
                                 Clock::time_point deadline);

    // Block until the socket is ready in the direction libssh2 is waiting on.
    // Returns false once the deadline has passed.
    bool wait_socket(Clock::time_point deadline);

    // Map the session's last libssh2 error (or `rc`) to a TransportError
    TransportError classify(int rc) const;
    std::string last_error_message() const;

    void free_channel(LIBSSH2_CHANNEL* channel);
};
