#pragma once

#include <cstddef>
#include <memory>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// Byte source. Blocking; one reader at a time.
class InputStream {
public:
    virtual ~InputStream() = default;

    // Read up to len bytes. Ok(0) means end of stream.
    virtual Result<std::size_t> read(char* buf, std::size_t len) = 0;

    // Bytes readable right now without blocking; 0 when unknown.
    virtual std::size_t available() { return 0; }

    virtual void close() {}
};

// Byte sink. Blocking; one writer at a time.
class OutputStream {
public:
    virtual ~OutputStream() = default;

    virtual Result<void> write(const char* buf, std::size_t len) = 0;

    virtual void close() {}
};

// Reads a file descriptor (stdin by default).
class FdInputStream : public InputStream {
public:
    explicit FdInputStream(int fd = 0) : fd_(fd) {}

    Result<std::size_t> read(char* buf, std::size_t len) override;
    std::size_t available() override;

    // Closes the descriptor; later reads report end of stream.
    void close() override;

private:
    int fd_;
};

// Always at end of stream.
class NullInputStream : public InputStream {
public:
    Result<std::size_t> read(char*, std::size_t) override { return Result<std::size_t>::Ok(0); }
};

// This process' standard input.
std::shared_ptr<InputStream> standard_input();

// Both directions of a connection share the socket; it closes when the last
// stream (or other owner) lets go.
using SharedSocket = std::shared_ptr<platform::SocketHandle>;

// Reads from a shared socket.
class SocketInputStream : public InputStream {
public:
    explicit SocketInputStream(SharedSocket sock) : sock_(std::move(sock)) {}

    Result<std::size_t> read(char* buf, std::size_t len) override;
    std::size_t available() override;

private:
    SharedSocket sock_;
};

// Writes to a shared socket. close() only shuts down our write direction so
// the peer sees EOF while we keep reading.
class SocketOutputStream : public OutputStream {
public:
    explicit SocketOutputStream(SharedSocket sock) : sock_(std::move(sock)) {}

    Result<void> write(const char* buf, std::size_t len) override;
    void close() override;

private:
    SharedSocket sock_;
    bool closed_ = false;
};
