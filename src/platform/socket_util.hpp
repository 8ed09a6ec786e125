#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define DROIDLINK_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define DROIDLINK_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a non-blocking TCP connection, waiting at most
// timeout_ms for it to complete. On failure returns DROIDLINK_INVALID_SOCKET
// and fills `error`; `timed_out` tells a timeout apart from a refusal.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error, bool& timed_out);

// Turn on TCP keepalive so a silently dropped peer is noticed.
void enable_keepalive(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
