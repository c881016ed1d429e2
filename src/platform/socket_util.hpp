#pragma once

// Cross-platform socket utilities. Everything here is loopback-only TCP.

#include <cstddef>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SOLOIST_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SOLOIST_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Bind a listening socket on 127.0.0.1 with an OS-assigned port.
Result<socket_t> listen_loopback(int backlog);

// Port a bound socket ended up on.
Result<int> local_port(socket_t sock);

// Connect to 127.0.0.1:port.
Result<socket_t> connect_loopback(int port);

// Accept one connection. Fails once the listening socket was shut down.
Result<socket_t> accept_connection(socket_t listen_sock);

// Read up to len bytes. 0 means the peer shut down its write side.
Result<std::size_t> recv_some(socket_t sock, char* buf, std::size_t len);

// Write the whole buffer, retrying on short writes. Never raises SIGPIPE.
Result<void> send_all(socket_t sock, const char* buf, std::size_t len);

// Bytes readable without blocking (0 if unknown).
std::size_t bytes_available(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Half-close: peer sees EOF, we can still read.
Result<void> shutdown_write(socket_t sock);

// Stop a listening socket so a blocked accept() returns.
void shutdown_listener(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

// Text for the last socket error (errno / WSAGetLastError).
std::string last_socket_error();

// Owns a socket and closes it on destruction.
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(socket_t sock) : sock_(sock) {}
    ~SocketHandle() { reset(); }

    SocketHandle(SocketHandle&& other) noexcept : sock_(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    socket_t get() const { return sock_; }
    bool valid() const { return sock_ != SOLOIST_INVALID_SOCKET; }

    socket_t release() {
        socket_t s = sock_;
        sock_ = SOLOIST_INVALID_SOCKET;
        return s;
    }

    void reset(socket_t sock = SOLOIST_INVALID_SOCKET) {
        if (sock_ != SOLOIST_INVALID_SOCKET) close_socket(sock_);
        sock_ = sock;
    }

private:
    socket_t sock_ = SOLOIST_INVALID_SOCKET;
};

} // namespace platform
