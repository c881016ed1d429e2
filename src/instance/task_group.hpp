#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// Fire-and-forget background work with optional drain.
//
// Each task runs on its own detached thread, so a blocked task never holds up
// process exit. The bookkeeping is shared with the running tasks: destroying
// the group while tasks still run is safe.
class TaskGroup {
public:
    TaskGroup();

    // Start fn. Anything it throws is logged under `name` and swallowed.
    Result<void> spawn(const std::string& name, std::function<void()> fn);

    // Number of tasks still running.
    std::size_t active() const;

    // Wait until no task runs. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout) const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable idle;
        std::size_t active = 0;
    };
    std::shared_ptr<State> state_;
};
