#include "socket_util.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <mutex>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/ioctl.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

#ifdef _WIN32
using sock_len_t = int;
#else
using sock_len_t = socklen_t;
#endif

static bool interrupted() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEINTR;
#else
    return errno == EINTR;
#endif
}

static sockaddr_in loopback_addr(int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<unsigned short>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return addr;
}

// Sockets must not leak into processes the handler spawns.
static void set_cloexec(socket_t sock) {
#ifdef _WIN32
    SetHandleInformation(reinterpret_cast<HANDLE>(sock), HANDLE_FLAG_INHERIT, 0);
#else
    int flags = fcntl(sock, F_GETFD, 0);
    if (flags >= 0) fcntl(sock, F_SETFD, flags | FD_CLOEXEC);
#endif
}

void init_networking() {
#ifdef _WIN32
    static std::once_flag once;
    std::call_once(once, [] {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
    });
#endif
}

std::string last_socket_error() {
#ifdef _WIN32
    return fmt::format("WSA error {}", WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

Result<socket_t> listen_loopback(int backlog) {
    init_networking();

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == SOLOIST_INVALID_SOCKET) {
        return Result<socket_t>::Err("socket() failed: " + last_socket_error());
    }
    set_cloexec(sock);

    sockaddr_in addr = loopback_addr(0);
    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string err = last_socket_error();
        close_socket(sock);
        return Result<socket_t>::Err("bind() on loopback failed: " + err);
    }

    if (listen(sock, backlog) != 0) {
        std::string err = last_socket_error();
        close_socket(sock);
        return Result<socket_t>::Err("listen() failed: " + err);
    }

    return Result<socket_t>::Ok(sock);
}

Result<int> local_port(socket_t sock) {
    sockaddr_in addr{};
    sock_len_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return Result<int>::Err("getsockname() failed: " + last_socket_error());
    }
    return Result<int>::Ok(ntohs(addr.sin_port));
}

Result<socket_t> connect_loopback(int port) {
    init_networking();

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == SOLOIST_INVALID_SOCKET) {
        return Result<socket_t>::Err("socket() failed: " + last_socket_error());
    }
    set_cloexec(sock);

#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    sockaddr_in addr = loopback_addr(port);
    int rc;
    do {
        rc = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } while (rc != 0 && interrupted());

    if (rc != 0) {
        std::string err = last_socket_error();
        close_socket(sock);
        return Result<socket_t>::Err(fmt::format("connect() to 127.0.0.1:{} failed: {}", port, err));
    }
    return Result<socket_t>::Ok(sock);
}

Result<socket_t> accept_connection(socket_t listen_sock) {
    for (;;) {
        sockaddr_in client_addr{};
        sock_len_t len = sizeof(client_addr);
        socket_t client = accept(listen_sock, reinterpret_cast<sockaddr*>(&client_addr), &len);
        if (client != SOLOIST_INVALID_SOCKET) {
            set_cloexec(client);
#ifdef SO_NOSIGPIPE
            int one = 1;
            setsockopt(client, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
            return Result<socket_t>::Ok(client);
        }
        if (!interrupted()) {
            return Result<socket_t>::Err("accept() failed: " + last_socket_error());
        }
    }
}

Result<std::size_t> recv_some(socket_t sock, char* buf, std::size_t len) {
    for (;;) {
#ifdef _WIN32
        int n = recv(sock, buf, static_cast<int>(len), 0);
#else
        ssize_t n = recv(sock, buf, len, 0);
#endif
        if (n >= 0) return Result<std::size_t>::Ok(static_cast<std::size_t>(n));
        if (!interrupted()) {
            return Result<std::size_t>::Err("recv() failed: " + last_socket_error());
        }
    }
}

Result<void> send_all(socket_t sock, const char* buf, std::size_t len) {
#ifdef MSG_NOSIGNAL
    const int flags = MSG_NOSIGNAL;
#else
    const int flags = 0;
#endif
    std::size_t sent = 0;
    while (sent < len) {
#ifdef _WIN32
        int n = send(sock, buf + sent, static_cast<int>(len - sent), flags);
#else
        ssize_t n = send(sock, buf + sent, len - sent, flags);
#endif
        if (n < 0) {
            if (interrupted()) continue;
            return Result<void>::Err("send() failed: " + last_socket_error());
        }
        sent += static_cast<std::size_t>(n);
    }
    return Result<void>::Ok();
}

std::size_t bytes_available(socket_t sock) {
#ifdef _WIN32
    u_long n = 0;
    if (ioctlsocket(sock, FIONREAD, &n) != 0) return 0;
    return static_cast<std::size_t>(n);
#else
    int n = 0;
    if (ioctl(sock, FIONREAD, &n) != 0 || n < 0) return 0;
    return static_cast<std::size_t>(n);
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

Result<void> shutdown_write(socket_t sock) {
#ifdef _WIN32
    int rc = shutdown(sock, SD_SEND);
#else
    int rc = shutdown(sock, SHUT_WR);
#endif
    if (rc != 0) {
        return Result<void>::Err("shutdown() failed: " + last_socket_error());
    }
    return Result<void>::Ok();
}

void shutdown_listener(socket_t sock) {
#ifdef _WIN32
    // Winsock only wakes accept() on close; the caller owns that.
    (void)sock;
#else
    // Linux wakes a blocked accept() with EINVAL and refuses new connections.
    shutdown(sock, SHUT_RDWR);
#endif
}

void close_socket(socket_t sock) {
    if (sock == SOLOIST_INVALID_SOCKET) return;
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
