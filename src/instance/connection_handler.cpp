#include "connection_handler.hpp"
#include "leader_listener.hpp"
#include "wire_codec.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>
#include <stdexcept>

CommandResult invoke_handler(const CommandHandler& handler, const Argv& args, InputStream& in) {
    CommandResult result;
    try {
        auto future = handler(args, in);
        if (!future.valid()) {
            throw std::runtime_error("handler returned no result");
        }
        result = future.get();
    } catch (const std::exception& e) {
        result.code = CODE_CMD_ERROR;
        result.output = fmt::format("Failed to process arguments: {}", e.what());
    } catch (...) {
        result.code = CODE_CMD_ERROR;
        result.output = "Failed to process arguments: unknown exception";
    }
    return result;
}

// Let the follower read our result before the socket goes away. Closing with
// unread input pending makes the kernel send RST, which can discard the
// result on the follower's side before it reads it.
static void linger_close(platform::SocketHandle& sock, int timeout_ms) {
    auto r = platform::shutdown_write(sock.get());
    if (r.is_err()) {
        soloist_log(fmt::format("Connection: {}", r.error));
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[4096];
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            soloist_log("Connection: follower did not close in time");
            return;
        }
        int revents = platform::poll_socket(sock.get(), POLLIN, static_cast<int>(left));
        if (revents == 0) continue;
        auto n = platform::recv_some(sock.get(), buf, sizeof(buf));
        if (n.is_err() || n.value == 0) return;
    }
}

void handle_connection(SharedSocket sock,
                       const CommandHandler& handler,
                       const ListenerState& state,
                       const InstanceOptions& options) {
    SocketInputStream in(sock);
    SocketOutputStream out(sock);

    CommandResult result;
    auto args = read_request(in, options.max_string_bytes);
    if (args.is_err()) {
        soloist_log(fmt::format("Connection: bad request: {}", args.error));
        result.code = CODE_ERROR;
        result.output = fmt::format("Failed to read arguments from socket: {}", args.error);
    } else if (state.is_stopping()) {
        result.code = CODE_ERROR;
        result.output = MSG_STOPPING;
    } else {
        soloist_log(fmt::format("Connection: running command ({} args)", args.value.size()));
        result = invoke_handler(handler, args.value, in);
    }

    auto w = write_result(out, result);
    if (w.is_err()) {
        soloist_log(fmt::format("Failed to return response code through socket: {}", w.error));
    } else {
        soloist_log(fmt::format("Connection: returned code {}", result.code));
    }

    linger_close(*sock, options.drain_timeout_ms);
}
