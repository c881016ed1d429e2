#include "unique_instance.hpp"
#include "follower_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/exit_hook.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <exception>
#include <ostream>
#include <stdexcept>

UniqueInstance::UniqueInstance(std::string app_id, InstanceOptions options)
    : app_id_(std::move(app_id)), options_(std::move(options)) {
    if (!options_.log_file.empty()) set_log_path(options_.log_file);
}

UniqueInstance::~UniqueInstance() {
    shutdown();
}

Result<Launch> UniqueInstance::start(CommandHandler handler, const Argv& args,
                                     std::shared_future<void> ready,
                                     const SystemStreams& streams) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return Result<Launch>::Err("Instance already started");
        if (shut_down_) return Result<Launch>::Err("Instance already shut down");
        started_ = true;
    }

    auto coordinator = LockCoordinator::acquire(app_id_, options_);
    if (coordinator.is_err()) return Result<Launch>::Err(coordinator.error);

    soloist_log(fmt::format("UniqueInstance[{}]: elected {} on {}", app_id_,
                            role_name(coordinator.value->role()),
                            coordinator.value->path().string()));

    if (!coordinator.value->is_leader()) {
        auto port = coordinator.value->read_port();
        auto released = coordinator.value->release();
        if (released.is_err()) {
            soloist_log(fmt::format("UniqueInstance[{}]: {}", app_id_, released.error));
        }
        if (port.is_err()) return Result<Launch>::Err(port.error);

        Launch launch;
        launch.role = Role::Follower;
        launch.exit_code = forward_command(port.value, args, streams, options_);
        return Result<Launch>::Ok(std::move(launch));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        lock_ = std::move(coordinator.value);
    }
    return start_leader(std::move(handler), args, std::move(ready), streams);
}

Result<Launch> UniqueInstance::start_leader(CommandHandler handler, const Argv& args,
                                            std::shared_future<void> ready,
                                            const SystemStreams& streams) {
    auto opened = LeaderListener::open(options_);
    if (opened.is_err()) return abort_leader(opened.error);
    std::shared_ptr<LeaderListener> listener(std::move(opened.value));

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shut_down_) return Result<Launch>::Err("Instance shut down while starting");
        auto published = lock_->publish_port(listener->port());
        if (published.is_err()) {
            lock.unlock();
            return abort_leader(published.error);
        }
        listener_ = listener;

        if (options_.install_exit_hook) {
            signal_slot_ = platform::register_signal_cleanup(lock_->path().string());
            if (signal_slot_ < 0) {
                soloist_log(fmt::format("UniqueInstance[{}]: no signal cleanup for {}",
                                        app_id_, lock_->path().string()));
            }
            exit_hook_id_ = platform::register_exit_cleanup([this]() { shutdown(); });
        }
    }
    soloist_log(fmt::format("UniqueInstance[{}]: port {} published", app_id_, listener->port()));

    auto promise = std::make_shared<std::promise<void>>();
    std::future<void> done = promise->get_future();

    std::shared_ptr<InputStream> in = streams.in;
    if (!in) in = std::make_shared<NullInputStream>();
    std::string app_id = app_id_;

    auto spawned = startup_.spawn("startup", [listener, handler, args, ready, streams, in,
                                              promise, app_id]() {
        if (ready.valid()) {
            try {
                ready.get();
            } catch (const std::exception& e) {
                soloist_log(fmt::format("UniqueInstance[{}]: caller not ready: {}", app_id, e.what()));
                promise->set_exception(std::current_exception());
                return;
            } catch (...) {
                promise->set_exception(std::current_exception());
                return;
            }
        }

        // Our own command always goes before any follower's.
        std::exception_ptr failure;
        try {
            auto future = handler(args, *in);
            if (!future.valid()) throw std::runtime_error("handler returned no result");
            print_result_output(future.get(), streams);
        } catch (const std::exception& e) {
            soloist_log(fmt::format("UniqueInstance[{}]: local command failed: {}", app_id, e.what()));
            failure = std::current_exception();
        } catch (...) {
            failure = std::current_exception();
        }

        auto served = listener->serve(handler);
        if (served.is_err()) {
            soloist_log(fmt::format("UniqueInstance[{}]: {}", app_id, served.error));
            if (!failure) failure = std::make_exception_ptr(std::runtime_error(served.error));
        }

        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    });
    if (spawned.is_err()) return abort_leader(spawned.error);

    Launch launch;
    launch.role = Role::Leader;
    launch.done = std::move(done);
    return Result<Launch>::Ok(std::move(launch));
}

// Elected but unable to serve: give the locks back so the next launch is not
// left waiting on them.
Result<Launch> UniqueInstance::abort_leader(const std::string& error) {
    soloist_log(fmt::format("UniqueInstance[{}]: leader start failed: {}", app_id_, error));
    shutdown();
    return Result<Launch>::Err(error);
}

void UniqueInstance::stop() {
    std::shared_ptr<LeaderListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) listener->stop();
}

void UniqueInstance::shutdown() {
    std::unique_ptr<LockCoordinator> coordinator;
    std::shared_ptr<LeaderListener> listener;
    int slot = -1;
    int hook = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        coordinator = std::move(lock_);
        listener = listener_;
        slot = signal_slot_;
        hook = exit_hook_id_;
        signal_slot_ = -1;
        exit_hook_id_ = -1;
    }

    if (listener) listener->stop();
    // Before the file goes: a new leader may recreate it at the same path.
    if (slot >= 0) platform::clear_signal_cleanup(slot);
    if (hook >= 0) platform::unregister_exit_cleanup(hook);

    if (coordinator) {
        auto r = coordinator->release();
        if (r.is_err()) {
            soloist_log(fmt::format("UniqueInstance[{}]: {}", app_id_, r.error));
        }
    }
    soloist_log(fmt::format("UniqueInstance[{}]: shut down", app_id_));
}

bool UniqueInstance::is_leader() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listener_ != nullptr;
}

bool UniqueInstance::is_stopping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listener_ ? listener_->is_stopping() : shut_down_;
}

ListenerPhase UniqueInstance::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener_) return listener_->phase();
    return started_ ? ListenerPhase::Stopped : ListenerPhase::Electing;
}

int UniqueInstance::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listener_ ? listener_->port() : 0;
}

fs::path UniqueInstance::lock_path() const {
    return lock_path_for(app_id_, options_.resolved_lock_dir());
}

bool UniqueInstance::wait_connections(std::chrono::milliseconds timeout) const {
    std::shared_ptr<LeaderListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    return listener ? listener->wait_connections(timeout) : true;
}

// ── Process entry point ──────────────────────────────────────

static void flush_streams(const SystemStreams& streams) {
    if (streams.out) streams.out->flush();
    if (streams.err) streams.err->flush();
}

std::future<void> start_unique_instance(UniqueInstance& instance,
                                        CommandHandler handler, const Argv& args,
                                        std::shared_future<void> ready,
                                        const SystemStreams& streams) {
    auto launched = instance.start(std::move(handler), args, std::move(ready), streams);
    if (launched.is_err()) {
        soloist_log(fmt::format("UniqueInstance[{}]: start failed: {}", instance.app_id(), launched.error));
        if (streams.err) *streams.err << "Failed to start instance: " << launched.error << "\n";
        flush_streams(streams);
        std::exit(CODE_ERROR);
    }

    if (launched.value.role == Role::Follower) {
        flush_streams(streams);
        std::exit(launched.value.exit_code);
    }
    return std::move(launched.value.done);
}
