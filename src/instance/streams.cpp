#include "streams.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <io.h>
#else
#  include <sys/ioctl.h>
#  include <unistd.h>
#endif

// ── FdInputStream ────────────────────────────────────────────

Result<std::size_t> FdInputStream::read(char* buf, std::size_t len) {
    if (fd_ < 0 || len == 0) return Result<std::size_t>::Ok(0);

    for (;;) {
#ifdef _WIN32
        int n = ::_read(fd_, buf, static_cast<unsigned>(len));
#else
        ssize_t n = ::read(fd_, buf, len);
#endif
        if (n >= 0) return Result<std::size_t>::Ok(static_cast<std::size_t>(n));
        if (errno == EINTR) continue;
        return Result<std::size_t>::Err(fmt::format("read(fd {}) failed: {}", fd_, std::strerror(errno)));
    }
}

std::size_t FdInputStream::available() {
#ifdef _WIN32
    return 0;
#else
    if (fd_ < 0) return 0;
    int n = 0;
    if (ioctl(fd_, FIONREAD, &n) != 0 || n < 0) return 0;
    return static_cast<std::size_t>(n);
#endif
}

void FdInputStream::close() {
    if (fd_ < 0) return;
#ifdef _WIN32
    ::_close(fd_);
#else
    ::close(fd_);
#endif
    fd_ = -1;
}

std::shared_ptr<InputStream> standard_input() {
    return std::make_shared<FdInputStream>(0);
}

// ── Socket streams ───────────────────────────────────────────

Result<std::size_t> SocketInputStream::read(char* buf, std::size_t len) {
    return platform::recv_some(sock_->get(), buf, len);
}

std::size_t SocketInputStream::available() {
    return platform::bytes_available(sock_->get());
}

Result<void> SocketOutputStream::write(const char* buf, std::size_t len) {
    if (closed_) return Result<void>::Err("write after close");
    return platform::send_all(sock_->get(), buf, len);
}

void SocketOutputStream::close() {
    if (closed_) return;
    closed_ = true;
    auto r = platform::shutdown_write(sock_->get());
    if (r.is_err()) {
        soloist_log(fmt::format("SocketOutputStream: {}", r.error));
    }
}
