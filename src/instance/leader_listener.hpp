#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "command.hpp"
#include "task_group.hpp"

// Life of a leader process, in order. Only Stopping is triggered from outside.
enum class ListenerPhase {
    Electing,     // lock file being raced for
    Publishing,   // listening, port being written, data lock held
    Accepting,    // serving followers, only the instance lock held
    Stopping,     // stop requested, acceptor unwinding
    Stopped,
};

const char* phase_name(ListenerPhase phase);

// State shared by the listener, its acceptor thread and connection threads.
// Owns the listening socket; closes it when the last holder goes.
class ListenerState {
public:
    explicit ListenerState(socket_t listen_sock);
    ~ListenerState();

    ListenerState(const ListenerState&) = delete;
    ListenerState& operator=(const ListenerState&) = delete;

    // Set the stop flag and shut the listening socket so a blocked accept()
    // returns. With no acceptor running the socket is closed right away,
    // otherwise the acceptor closes it on its way out. Idempotent.
    void request_stop();
    bool is_stopping() const { return stopping_.load(); }

    ListenerPhase phase() const { return phase_.load(); }
    void set_phase(ListenerPhase phase) { phase_.store(phase); }

    // Close the listening socket; connects are refused from then on.
    // Only the acceptor, or a stop with no acceptor, may call this.
    void close_listener();

    socket_t socket() const { return sock_.load(); }

private:
    std::atomic<bool> stopping_{false};
    std::atomic<ListenerPhase> phase_{ListenerPhase::Publishing};
    std::atomic<socket_t> sock_;
};

// Loopback listener of the leader. Accepts followers on a dedicated thread
// and serves each one on its own task.
class LeaderListener {
public:
    // Bind 127.0.0.1 on an OS-assigned port.
    static Result<std::unique_ptr<LeaderListener>> open(const InstanceOptions& options);

    // Requests stop; running connections finish on their own.
    ~LeaderListener();

    LeaderListener(const LeaderListener&) = delete;
    LeaderListener& operator=(const LeaderListener&) = delete;

    int port() const { return port_; }

    // Start the acceptor thread. Does nothing once stop was requested.
    Result<void> serve(CommandHandler handler);

    // Stop accepting. Idempotent.
    void stop() { state_->request_stop(); }
    bool is_stopping() const { return state_->is_stopping(); }
    ListenerPhase phase() const { return state_->phase(); }

    // Wait for connection threads still running. False on timeout.
    bool wait_connections(std::chrono::milliseconds timeout) const;

private:
    LeaderListener(std::shared_ptr<ListenerState> state, int port, InstanceOptions options);

    std::shared_ptr<ListenerState> state_;
    int port_;
    InstanceOptions options_;
    TaskGroup acceptor_;
    TaskGroup connections_;
    bool serving_ = false;
};
