#include "lock_coordinator.hpp"
#include "wire_codec.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

fs::path lock_path_for(const std::string& app_id, const fs::path& dir) {
    return dir / ("." + sanitize_filename(app_id));
}

LockCoordinator::LockCoordinator(fs::path path, Role role,
                                 std::unique_ptr<platform::LockFile> file,
                                 std::unique_ptr<platform::ExclusiveRegionLock> data_lock,
                                 std::unique_ptr<platform::ExclusiveRegionLock> instance_lock)
    : path_(std::move(path)),
      role_(role),
      file_(std::move(file)),
      data_lock_(std::move(data_lock)),
      instance_lock_(std::move(instance_lock)) {}

LockCoordinator::~LockCoordinator() {
    auto r = release();
    if (r.is_err()) {
        soloist_log(fmt::format("LockCoordinator: release on destruction: {}", r.error));
    }
}

Result<std::unique_ptr<LockCoordinator>> LockCoordinator::acquire(const std::string& app_id,
                                                                  const InstanceOptions& options) {
    return acquire_path(lock_path_for(app_id, options.resolved_lock_dir()));
}

Result<std::unique_ptr<LockCoordinator>> LockCoordinator::acquire_path(const fs::path& lock_path) {
    using R = Result<std::unique_ptr<LockCoordinator>>;

    // A departing leader deletes the file before releasing its instance lock.
    // Whoever opened the old file meanwhile would otherwise elect itself on a
    // file nobody else can see, so start over on the new one.
    for (int attempt = 0; attempt <= LOCK_STALE_RETRIES; ++attempt) {
        auto opened = platform::LockFile::open(lock_path);
        if (opened.is_err()) return R::Err(opened.error);
        auto file = std::move(opened.value);

        auto data_lock = std::make_unique<platform::ExclusiveRegionLock>(
            *file, LOCK_DATA_OFFSET, LOCK_DATA_LENGTH);
        auto locked = data_lock->acquire_blocking();
        if (locked.is_err()) return R::Err(locked.error);

        auto instance_lock = std::make_unique<platform::ExclusiveRegionLock>(
            *file, LOCK_INSTANCE_OFFSET, LOCK_INSTANCE_LENGTH);
        auto won = instance_lock->try_acquire();
        if (won.is_err()) return R::Err(won.error);

        if (!file->still_linked()) {
            soloist_log(fmt::format("LockCoordinator: {} was replaced while locking, retrying ({})",
                                    lock_path.string(), attempt + 1));
            continue;   // locks drop with the file
        }

        Role role = won.value ? Role::Leader : Role::Follower;
        soloist_log(fmt::format("LockCoordinator: pid {} is {} for {}",
                                platform::process_id(), role_name(role), lock_path.string()));
        return R::Ok(std::unique_ptr<LockCoordinator>(new LockCoordinator(
            lock_path, role, std::move(file), std::move(data_lock), std::move(instance_lock))));
    }

    return R::Err(fmt::format("Lock file {} keeps disappearing; giving up after {} attempts",
                              lock_path.string(), LOCK_STALE_RETRIES + 1));
}

Result<void> LockCoordinator::publish_port(int port) {
    if (role_ != Role::Leader) {
        return Result<void>::Err("Only the leader publishes its port");
    }
    if (released_) {
        return Result<void>::Err("Lock file already released");
    }

    auto bytes = encode_int32_be(port);
    auto r = file_->write_at(LOCK_DATA_OFFSET, bytes.data(), bytes.size());
    if (r.is_err()) return Result<void>::Err("Failed to write local port in lock file: " + r.error);

    r = file_->sync();
    if (r.is_err()) return r;

    r = data_lock_->release();
    if (r.is_err()) return r;

    soloist_log(fmt::format("LockCoordinator: published port {} in {}", port, path_.string()));
    return Result<void>::Ok();
}

Result<int> LockCoordinator::read_port() {
    if (role_ != Role::Follower) {
        return Result<int>::Err("Only a follower reads the leader's port");
    }
    if (released_) {
        return Result<int>::Err("Lock file already released");
    }

    // Holding the data lock proved the leader finished writing; not needed
    // any longer.
    auto r = data_lock_->release();
    if (r.is_err()) return Result<int>::Err(r.error);

    char buf[LOCK_DATA_LENGTH];
    auto n = file_->read_at(LOCK_DATA_OFFSET, buf, sizeof(buf));
    if (n.is_err()) return Result<int>::Err(n.error);
    if (n.value != sizeof(buf)) {
        return Result<int>::Err("Failed to read socket port to connect to unique instance");
    }

    int32_t port = decode_int32_be(buf);
    if (port <= 0 || port > 65535) {
        return Result<int>::Err(fmt::format("Invalid port {} in lock file {}", port, path_.string()));
    }
    return Result<int>::Ok(port);
}

Result<void> LockCoordinator::release() {
    if (released_) return Result<void>::Ok();
    released_ = true;

    Result<void> outcome = Result<void>::Ok();
    auto keep_first_error = [&outcome](const Result<void>& r) {
        if (r.is_err() && outcome.is_ok()) outcome = r;
    };

    if (role_ == Role::Leader) {
        // Unlink before unlocking: once the instance lock is free, the path
        // must already belong to the next leader.
        keep_first_error(file_->remove());
        keep_first_error(instance_lock_->release());
    }
    keep_first_error(data_lock_->release());
    file_->close();

    soloist_log(fmt::format("LockCoordinator: released {} ({})", path_.string(), role_name(role_)));
    return outcome;
}
