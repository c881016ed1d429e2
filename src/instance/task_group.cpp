#include "task_group.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <system_error>
#include <thread>

TaskGroup::TaskGroup() : state_(std::make_shared<State>()) {}

Result<void> TaskGroup::spawn(const std::string& name, std::function<void()> fn) {
    auto state = state_;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->active;
    }

    auto body = [state, name, fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            soloist_log(fmt::format("{}: task failed: {}", name, e.what()));
        } catch (...) {
            soloist_log(fmt::format("{}: task failed with a non-standard exception", name));
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (--state->active == 0) state->idle.notify_all();
    };

    try {
        std::thread(std::move(body)).detach();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (--state->active == 0) state->idle.notify_all();
        return Result<void>::Err(fmt::format("Cannot start thread for {}: {}", name, e.what()));
    }
    return Result<void>::Ok();
}

std::size_t TaskGroup::active() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->active;
}

bool TaskGroup::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->idle.wait_for(lock, timeout, [this] { return state_->active == 0; });
}
