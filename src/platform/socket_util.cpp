#include "socket_util.hpp"
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error, bool& timed_out) {
    timed_out = false;
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        error = "Failed to resolve host: " + host;
        return DROIDLINK_INVALID_SOCKET;
    }

    socket_t sock = DROIDLINK_INVALID_SOCKET;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == DROIDLINK_INVALID_SOCKET) {
            error = "Failed to create socket";
            continue;
        }

        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        if (ret == 0) break;

        if (errno != EINPROGRESS) {
            error = "Failed to connect: " + std::string(strerror(errno));
            close_socket(sock);
            sock = DROIDLINK_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            error = "Connection timed out: " + host + ":" + port_str;
            timed_out = true;
            close_socket(sock);
            sock = DROIDLINK_INVALID_SOCKET;
            continue;
        }

        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            error = "Connection failed: " + std::string(strerror(sock_err));
            close_socket(sock);
            sock = DROIDLINK_INVALID_SOCKET;
            continue;
        }
        break;
    }

    freeaddrinfo(res);
    if (sock != DROIDLINK_INVALID_SOCKET) timed_out = false;
    return sock;
}

void enable_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
    int keepidle = 30;
    int keepintvl = 10;
    int keepcnt = 3;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
