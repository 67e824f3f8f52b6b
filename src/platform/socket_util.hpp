#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOGDI
#    define NOGDI   // wingdi.h #defines ERROR, which clashes with LogLevel::ERROR
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHBATCH_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHBATCH_INVALID_SOCKET (-1)
#endif

namespace platform {

struct TcpConnectResult {
    socket_t sock;          // SSHBATCH_INVALID_SOCKET on failure
    bool timed_out;
    std::string error;

    bool ok() const { return sock != SSHBATCH_INVALID_SOCKET; }
};

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Resolve host (numeric or DNS, IPv4 or IPv6) and connect to the first
// address that answers. The returned socket is non-blocking with TCP
// keepalive enabled.
TcpConnectResult connect_tcp(const std::string& host, int port, int timeout_ms);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
