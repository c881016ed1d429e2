#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <core/types.hpp>
#include "streams.hpp"
#include "task_group.hpp"

// Shared cancellation flag. Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Copy in to out until in ends or the token is cancelled. Each read asks for
// what is available (at least one byte, at most buffer_size). Returns the
// number of bytes written.
Result<std::size_t> pump_stream(InputStream& in, OutputStream& out,
                                const CancelToken& token, std::size_t buffer_size);

// Streams a follower's stdin to the leader in the background.
//
// When the copy ends, for whatever reason, both streams are closed: the
// socket's write side is shut so the leader sees end of input.
class StdinPump {
public:
    StdinPump(std::shared_ptr<InputStream> in,
              std::shared_ptr<OutputStream> out,
              std::size_t buffer_size);

    Result<void> start();

    // Stop after the current read. A read already blocked on a terminal stays
    // blocked until input arrives.
    void cancel() { token_.cancel(); }

    // Wait for the copy to end. False on timeout.
    bool wait_done(std::chrono::milliseconds timeout);

    std::size_t bytes_sent() const;

private:
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::size_t bytes = 0;
    };

    std::shared_ptr<InputStream> in_;
    std::shared_ptr<OutputStream> out_;
    std::size_t buffer_size_;
    CancelToken token_;
    std::shared_ptr<Shared> shared_;
    TaskGroup tasks_;
};
