#include "follower_forwarder.hpp"
#include "stdin_pump.hpp"
#include "streams.hpp"
#include "wire_codec.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ostream>

static Result<CommandResult> exchange(int port, const Argv& args,
                                      const SystemStreams& streams,
                                      const InstanceOptions& options) {
    using R = Result<CommandResult>;

    auto conn = platform::connect_loopback(port);
    if (conn.is_err()) return R::Err(conn.error);
    soloist_log(fmt::format("Follower: connected to leader on port {}", port));

    auto sock = std::make_shared<platform::SocketHandle>(conn.value);
    auto out = std::make_shared<SocketOutputStream>(sock);
    SocketInputStream in(sock);

    auto w = write_request(*out, args);
    if (w.is_err()) return R::Err(w.error);

    // stdin goes up while we wait for the result; the leader may answer
    // before it has read all of it.
    std::unique_ptr<StdinPump> pump;
    if (streams.in) {
        pump.reset(new StdinPump(streams.in, out, options.pump_buffer_size));
        auto started = pump->start();
        if (started.is_err()) return R::Err(started.error);
    } else {
        out->close();
    }

    auto result = read_result(in, options.max_string_bytes);

    if (pump) {
        pump->cancel();
        if (!pump->wait_done(std::chrono::milliseconds(options.drain_timeout_ms))) {
            // Blocked on a terminal read; it is left to die with the process.
            soloist_log("Follower: stdin pump still blocked, abandoning it");
        }
    }
    return result;
}

int forward_command(int port, const Argv& args,
                    const SystemStreams& streams,
                    const InstanceOptions& options) {
    auto result = exchange(port, args, streams, options);
    if (result.is_err()) {
        soloist_log(fmt::format("Follower: {}", result.error));
        if (streams.err) {
            *streams.err << "Failed to execute command on unique instance: " << result.error << "\n";
            streams.err->flush();
        }
        return CODE_ERROR;
    }

    soloist_log(fmt::format("Follower: leader returned code {}", result.value.code));
    print_result_output(result.value, streams);
    return result.value.code;
}
