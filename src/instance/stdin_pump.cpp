#include "stdin_pump.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <vector>

Result<std::size_t> pump_stream(InputStream& in, OutputStream& out,
                                const CancelToken& token, std::size_t buffer_size) {
    std::vector<char> buf(std::max<std::size_t>(buffer_size, 1));
    std::size_t total = 0;

    while (!token.cancelled()) {
        std::size_t want = std::min(std::max<std::size_t>(in.available(), 1), buf.size());
        auto n = in.read(buf.data(), want);
        if (n.is_err()) return Result<std::size_t>::Err(n.error);
        if (n.value == 0) break;
        if (token.cancelled()) break;

        auto w = out.write(buf.data(), n.value);
        if (w.is_err()) return Result<std::size_t>::Err(w.error);
        total += n.value;
    }
    return Result<std::size_t>::Ok(total);
}

StdinPump::StdinPump(std::shared_ptr<InputStream> in,
                     std::shared_ptr<OutputStream> out,
                     std::size_t buffer_size)
    : in_(std::move(in)), out_(std::move(out)), buffer_size_(buffer_size),
      shared_(std::make_shared<Shared>()) {}

Result<void> StdinPump::start() {
    auto in = in_;
    auto out = out_;
    auto token = token_;
    auto shared = shared_;
    auto size = buffer_size_;

    auto r = tasks_.spawn("stdin pump", [in, out, token, shared, size]() {
        std::size_t sent = 0;
        try {
            auto pumped = pump_stream(*in, *out, token, size);
            if (pumped.is_err()) {
                soloist_log(fmt::format("StdinPump: {}", pumped.error));
            } else {
                sent = pumped.value;
            }
        } catch (const std::exception& e) {
            soloist_log(fmt::format("StdinPump: {}", e.what()));
        }

        in->close();
        out->close();
        soloist_log(fmt::format("StdinPump: done, {} bytes", sent));

        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->bytes = sent;
        shared->done = true;
        shared->cv.notify_all();
    });

    if (r.is_err()) {
        // Nothing will ever close the write side otherwise.
        out_->close();
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->done = true;
        shared_->cv.notify_all();
    }
    return r;
}

bool StdinPump::wait_done(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    return shared_->cv.wait_for(lock, timeout, [this] { return shared_->done; });
}

std::size_t StdinPump::bytes_sent() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->bytes;
}
