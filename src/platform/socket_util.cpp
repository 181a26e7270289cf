#include "socket_util.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
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

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

// One connect attempt against a single resolved address.
static Result<socket_t> connect_one(const struct addrinfo* ai, int timeout_ms) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock == FLEET_INVALID_SOCKET) {
        return Result<socket_t>::Err(ErrorKind::Connect,
            fmt::format("socket: {}", std::strerror(errno)));
    }

    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        return Result<socket_t>::Err(ErrorKind::Connect,
            fmt::format("connect: {}", std::strerror(err)));
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            return Result<socket_t>::Err(ErrorKind::Connect, "connect timed out");
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err(ErrorKind::Connect,
                fmt::format("connect: {}", std::strerror(sock_err)));
        }
    }

    int nodelay = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));
    int keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&keepalive), sizeof(keepalive));

    return Result<socket_t>::Ok(sock);
}

Result<socket_t> dial_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    // getaddrinfo is reentrant; gethostbyname is not safe across fan-out threads
    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(ErrorKind::Connect,
            fmt::format("failed to resolve {}: {}", host, gai_strerror(gai)));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address";
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            last_error = "connect timed out";
            break;
        }
        auto attempt = connect_one(ai, static_cast<int>(remaining));
        if (attempt.is_ok()) {
            freeaddrinfo(res);
            return attempt;
        }
        last_error = attempt.error;
    }
    freeaddrinfo(res);

    return Result<socket_t>::Err(ErrorKind::Connect,
        fmt::format("{}:{}: {}", host, port, last_error));
}

} // namespace platform
