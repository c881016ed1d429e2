#pragma once

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include "command.hpp"
#include "leader_listener.hpp"
#include "lock_coordinator.hpp"
#include "task_group.hpp"

namespace fs = std::filesystem;

// Outcome of UniqueInstance::start().
struct Launch {
    Role role = Role::Follower;

    // Follower: code the leader returned (or CODE_ERROR if forwarding failed).
    int exit_code = CODE_SUCCESS;

    // Leader: ready once the local command ran and followers are being
    // served. Fails when `ready` failed (nothing is served then) or when the
    // local command threw (followers are served anyway).
    std::future<void> done;
};

// Single-instance application front door.
//
// The first process to start for an app id becomes the leader: it runs its
// own command, then serves the commands of every later process (followers),
// which forward their arguments and stdin and print the leader's answer.
class UniqueInstance {
public:
    explicit UniqueInstance(std::string app_id, InstanceOptions options = {});
    ~UniqueInstance();

    UniqueInstance(const UniqueInstance&) = delete;
    UniqueInstance& operator=(const UniqueInstance&) = delete;

    // Elect, then either serve (leader) or forward (follower). Can only be
    // called once. `ready` gates the leader's local command; an invalid
    // future counts as ready.
    Result<Launch> start(CommandHandler handler, const Argv& args,
                         std::shared_future<void> ready,
                         const SystemStreams& streams = SystemStreams::standard());

    // Stop accepting followers. Idempotent.
    void stop();

    // stop(), then give up the lock file. Idempotent.
    void shutdown();

    bool is_leader() const;
    bool is_stopping() const;
    ListenerPhase phase() const;

    // Leader listener port, 0 if none.
    int port() const;

    const std::string& app_id() const { return app_id_; }
    fs::path lock_path() const;

    // Leader: wait for running follower connections. False on timeout.
    bool wait_connections(std::chrono::milliseconds timeout) const;

private:
    Result<Launch> start_leader(CommandHandler handler, const Argv& args,
                                std::shared_future<void> ready, const SystemStreams& streams);
    Result<Launch> abort_leader(const std::string& error);

    std::string app_id_;
    InstanceOptions options_;

    mutable std::mutex mutex_;
    bool started_ = false;
    bool shut_down_ = false;
    std::unique_ptr<LockCoordinator> lock_;
    std::shared_ptr<LeaderListener> listener_;
    TaskGroup startup_;
    int exit_hook_id_ = -1;
    int signal_slot_ = -1;
};

// Process-level entry point. Followers, and any failure to start, end the
// process here (std::exit with the code to report). Only the leader returns.
std::future<void> start_unique_instance(UniqueInstance& instance,
                                        CommandHandler handler, const Argv& args,
                                        std::shared_future<void> ready,
                                        const SystemStreams& streams = SystemStreams::standard());
