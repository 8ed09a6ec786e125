#include "ssh_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <mutex>

static void init_libssh2_once() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

SshTransport::SshTransport()
    : session_(nullptr), sock_(DROIDLINK_INVALID_SOCKET), timeout_secs_(DEFAULT_TIMEOUT_SECS) {
}

SshTransport::~SshTransport() {
    close();
}

bool SshTransport::wait_socket(Clock::time_point deadline) {
    auto now = Clock::now();
    if (now >= deadline) return false;

    int remaining = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    // Short slices keep a missed wakeup from eating the whole deadline
    // Errors on the socket are left for the next libssh2 call to report
    platform::poll_socket(sock_, events, std::min(remaining, 100));
    return true;
}

TransportError SshTransport::classify(int rc) const {
    int code = rc;
    if (session_ && (code == 0 || code == LIBSSH2_ERROR_EAGAIN)) {
        code = libssh2_session_last_errno(session_);
    }

    switch (code) {
        case LIBSSH2_ERROR_TIMEOUT:
            return TransportError::TIMEOUT;
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            return TransportError::BROKEN_PIPE;
        case LIBSSH2_ERROR_INVALID_MAC:
        case LIBSSH2_ERROR_DECRYPT:
            return TransportError::INVALID_CHECKSUM;
        case LIBSSH2_ERROR_CHANNEL_REQUEST_DENIED:
        case LIBSSH2_ERROR_CHANNEL_FAILURE:
        case LIBSSH2_ERROR_CHANNEL_UNKNOWN:
            return TransportError::INVALID_COMMAND;
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
        case LIBSSH2_ERROR_BAD_USE:
            return TransportError::MALFORMED_STATE;
        case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
        case LIBSSH2_ERROR_FILE:
            return TransportError::AUTH_FAILED;
        default:
            return TransportError::INVALID_RESPONSE;
    }
}

std::string SshTransport::last_error_message() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown libssh2 error";
}

TransportStatus SshTransport::open(const DeviceTarget& target, const KeyPair* key) {
    close();
    init_libssh2_once();

    timeout_secs_ = target.timeout > 0 ? target.timeout : DEFAULT_TIMEOUT_SECS;
    target_str_ = target.str();
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);

    std::string error;
    bool timed_out = false;
    sock_ = platform::connect_tcp(target.host, target.port, timeout_secs_ * 1000, error, timed_out);
    if (sock_ == DROIDLINK_INVALID_SOCKET) {
        return TransportStatus::Err(timed_out ? TransportError::TIMEOUT : TransportError::UNREACHABLE,
                                    error);
    }
    platform::enable_keepalive(sock_);

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return TransportStatus::Err(TransportError::MALFORMED_STATE, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // Key exchange
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) {
            close();
            return TransportStatus::Err(TransportError::TIMEOUT,
                                        "SSH handshake timed out: " + target_str_);
        }
    }
    if (rc != 0) {
        auto kind = classify(rc);
        std::string msg = "SSH handshake failed: " + last_error_message();
        close();
        return TransportStatus::Err(kind, msg);
    }

    // Session-level keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    auto auth = authenticate(target, key, deadline);
    if (auth.failed()) {
        close();
        return auth;
    }

    log_debug("ssh: session open to {} as {}", target_str_, target.user);
    return TransportStatus::Ok();
}

TransportStatus SshTransport::authenticate(const DeviceTarget& target, const KeyPair* key,
                                           Clock::time_point deadline) {
    const std::string& user = target.user;
    int rc;

    if (key && !key->private_key.empty()) {
        const char* pub = key->public_key.empty() ? nullptr : key->public_key.data();
        while ((rc = libssh2_userauth_publickey_frommemory(
                    session_, user.c_str(), user.length(),
                    pub, key->public_key.size(),
                    key->private_key.data(), key->private_key.size(),
                    nullptr)) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket(deadline)) {
                return TransportStatus::Err(TransportError::TIMEOUT, "Authentication timed out");
            }
        }
        if (rc == 0) return TransportStatus::Ok();
        return TransportStatus::Err(TransportError::AUTH_FAILED,
                                    "Public key rejected: " + last_error_message());
    }

    // No key: the device may accept "none" authentication
    char* methods = nullptr;
    while ((methods = libssh2_userauth_list(session_, user.c_str(),
                                            static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return TransportStatus::Ok();
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_socket(deadline)) {
            return TransportStatus::Err(TransportError::TIMEOUT, "Authentication timed out");
        }
    }
    if (libssh2_userauth_authenticated(session_)) {
        return TransportStatus::Ok();
    }

    return TransportStatus::Err(TransportError::AUTH_FAILED,
        fmt::format("No key configured and the device requires authentication ({})",
                    methods ? methods : "no methods offered"));
}

ShellResult SshTransport::execute(const std::string& command) {
    if (!session_) {
        return ShellResult::Err(TransportError::MALFORMED_STATE, "No session available");
    }

    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);

    // Open an exec channel (no PTY)
    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return ShellResult::Err(classify(0), "Failed to open exec channel: " + last_error_message());
        }
        if (!wait_socket(deadline)) {
            return ShellResult::Err(TransportError::TIMEOUT, "Timed out opening exec channel");
        }
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) {
            free_channel(channel);
            return ShellResult::Err(TransportError::TIMEOUT, "Timed out starting command");
        }
    }
    if (rc != 0) {
        auto kind = classify(rc);
        std::string msg = "Failed to exec command: " + last_error_message();
        free_channel(channel);
        return ShellResult::Err(kind, msg);
    }

    // Read stdout until the channel reports EOF
    std::string output;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            if (libssh2_channel_eof(channel)) break;
            if (!wait_socket(deadline)) {
                free_channel(channel);
                return ShellResult::Err(TransportError::TIMEOUT,
                    fmt::format("Command timed out after {}s", timeout_secs_));
            }
            continue;
        }
        auto kind = classify(static_cast<int>(n));
        std::string msg = "SSH channel read error: " + last_error_message();
        free_channel(channel);
        return ShellResult::Err(kind, msg);
    }

    // Drain stderr so the channel can close cleanly
    std::string stderr_data;
    ssize_t n;
    while ((n = libssh2_channel_read_stderr(channel, buf, sizeof(buf))) > 0) {
        stderr_data.append(buf, static_cast<size_t>(n));
    }
    if (!stderr_data.empty()) {
        log_debug("ssh: stderr from {}: {}", target_str_, stderr_data.substr(0, 500));
    }

    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) break;
    }
    int exit_status = (rc == 0) ? libssh2_channel_get_exit_status(channel) : -1;
    free_channel(channel);

    ShellResult r = output.empty() ? ShellResult::None()
                                   : ShellResult::Output(std::move(output), exit_status);
    r.exit_status = exit_status;
    r.stderr_data = std::move(stderr_data);
    return r;
}

void SshTransport::free_channel(LIBSSH2_CHANNEL* channel) {
    if (!channel) return;
    auto deadline = Clock::now() + std::chrono::seconds(2);
    while (libssh2_channel_free(channel) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) break;
    }
}

void SshTransport::close() {
    if (session_) {
        // Bounded so a dead peer cannot stall teardown
        auto deadline = Clock::now() + std::chrono::seconds(2);
        while (libssh2_session_disconnect(session_, "Normal disconnection") == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket(deadline)) break;
        }
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != DROIDLINK_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = DROIDLINK_INVALID_SOCKET;
    }
}
