#include "leader_listener.hpp"
#include "connection_handler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

const char* phase_name(ListenerPhase phase) {
    switch (phase) {
        case ListenerPhase::Electing:   return "electing";
        case ListenerPhase::Publishing: return "publishing";
        case ListenerPhase::Accepting:  return "accepting";
        case ListenerPhase::Stopping:   return "stopping";
        case ListenerPhase::Stopped:    return "stopped";
    }
    return "unknown";
}

// ── ListenerState ─────────────────────────────────────────

ListenerState::ListenerState(socket_t listen_sock) : sock_(listen_sock) {}

ListenerState::~ListenerState() {
    close_listener();
}

void ListenerState::close_listener() {
    platform::close_socket(sock_.exchange(SOLOIST_INVALID_SOCKET));
}

void ListenerState::request_stop() {
    if (stopping_.exchange(true)) return;

    // Only the acceptor moves Accepting -> Stopped; anything earlier has no
    // acceptor to wait for.
    ListenerPhase expected = ListenerPhase::Accepting;
    if (phase_.compare_exchange_strong(expected, ListenerPhase::Stopping)) {
        platform::shutdown_listener(sock_.load());
    } else {
        phase_.store(ListenerPhase::Stopped);
        close_listener();
    }
    soloist_log("LeaderListener: stop requested");
}

// ── Acceptor ──────────────────────────────────────────────

static void accept_loop(std::shared_ptr<ListenerState> state,
                        std::shared_ptr<const CommandHandler> handler,
                        InstanceOptions options,
                        TaskGroup connections) {
    while (!state->is_stopping()) {
        int revents = platform::poll_socket(state->socket(), POLLIN, ACCEPT_POLL_MS);
        if (state->is_stopping()) break;
        if (revents == 0) continue;

        auto client = platform::accept_connection(state->socket());
        if (client.is_err()) {
            // A shut listening socket fails accept(): that is the stop path.
            if (state->is_stopping()) break;
            soloist_log(fmt::format("LeaderListener: {}", client.error));
            platform::sleep_ms(ACCEPT_RETRY_DELAY_MS);
            continue;
        }

        auto sock = std::make_shared<platform::SocketHandle>(client.value);
        soloist_log("LeaderListener: follower connected");

        auto spawned = connections.spawn("connection", [sock, handler, state, options]() {
            handle_connection(sock, *handler, *state, options);
        });
        if (spawned.is_err()) {
            soloist_log(fmt::format("LeaderListener: {}", spawned.error));
        }
    }

    state->close_listener();
    state->set_phase(ListenerPhase::Stopped);
    soloist_log("LeaderListener: acceptor stopped");
}

// ── LeaderListener ────────────────────────────────────────

LeaderListener::LeaderListener(std::shared_ptr<ListenerState> state, int port, InstanceOptions options)
    : state_(std::move(state)), port_(port), options_(std::move(options)) {}

LeaderListener::~LeaderListener() {
    stop();
}

Result<std::unique_ptr<LeaderListener>> LeaderListener::open(const InstanceOptions& options) {
    using R = Result<std::unique_ptr<LeaderListener>>;

    auto sock = platform::listen_loopback(options.backlog);
    if (sock.is_err()) return R::Err(sock.error);

    auto state = std::make_shared<ListenerState>(sock.value);
    auto port = platform::local_port(sock.value);
    if (port.is_err()) return R::Err(port.error);

    soloist_log(fmt::format("LeaderListener: listening on 127.0.0.1:{} (backlog {})",
                            port.value, options.backlog));
    return R::Ok(std::unique_ptr<LeaderListener>(
        new LeaderListener(std::move(state), port.value, options)));
}

Result<void> LeaderListener::serve(CommandHandler handler) {
    if (serving_) return Result<void>::Err("Listener already serving");
    if (state_->is_stopping()) {
        soloist_log("LeaderListener: stopped before serving");
        return Result<void>::Ok();
    }

    serving_ = true;
    state_->set_phase(ListenerPhase::Accepting);
    // A stop that raced with the phase change saw no acceptor to wait for.
    if (state_->is_stopping()) {
        state_->close_listener();
        state_->set_phase(ListenerPhase::Stopped);
        return Result<void>::Ok();
    }

    auto shared_handler = std::make_shared<const CommandHandler>(std::move(handler));
    auto r = acceptor_.spawn("acceptor", [state = state_, shared_handler,
                                          options = options_, connections = connections_]() {
        accept_loop(state, shared_handler, options, connections);
    });
    if (r.is_err()) {
        state_->request_stop();
        state_->close_listener();
        state_->set_phase(ListenerPhase::Stopped);
        return r;
    }

    soloist_log(fmt::format("LeaderListener: accepting on port {}", port_));
    return Result<void>::Ok();
}

bool LeaderListener::wait_connections(std::chrono::milliseconds timeout) const {
    return connections_.wait_idle(timeout);
}
