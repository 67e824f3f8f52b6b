#include "socket_util.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
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

static void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

static int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

static bool connect_in_progress(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK;
#else
    return err == EINPROGRESS;
#endif
}

// Non-blocking connect of one resolved address. Returns 0, or the socket
// error; ETIMEDOUT when the poll deadline passes.
static int try_connect(socket_t sock, const struct addrinfo* ai, int timeout_ms) {
    int ret = ::connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
    if (ret == 0) return 0;

    int err = last_socket_error();
    if (!connect_in_progress(err)) return err;

    int revents = poll_socket(sock, POLLOUT, timeout_ms);
    if (revents == 0) return ETIMEDOUT;

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
    return sock_err;
}

TcpConnectResult connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (gai != 0 || !addrs) {
        return {SSHBATCH_INVALID_SOCKET, false,
                fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai))};
    }

    TcpConnectResult result{SSHBATCH_INVALID_SOCKET, false, ""};
    for (const struct addrinfo* ai = addrs; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SSHBATCH_INVALID_SOCKET) {
            result.error = fmt::format("Failed to create socket: {}", strerror(last_socket_error()));
            continue;
        }

        set_nonblocking(sock);
        int err = try_connect(sock, ai, timeout_ms);
        if (err == 0) {
            // Let the kernel notice a peer that vanished without closing
            int keepalive = 1;
            setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE,
                       reinterpret_cast<const char*>(&keepalive), sizeof(keepalive));
            result = {sock, false, ""};
            break;
        }

        close_socket(sock);
        result.timed_out = (err == ETIMEDOUT);
        result.error = result.timed_out
            ? fmt::format("Connection to {}:{} timed out after {}ms", host, port, timeout_ms)
            : fmt::format("Unable to connect to {}:{}: {}", host, port, strerror(err));
    }

    freeaddrinfo(addrs);
    return result;
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

} // namespace platform
