#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/region_lock.hpp>

namespace fs = std::filesystem;

// <dir>/.<sanitized app id>
fs::path lock_path_for(const std::string& app_id, const fs::path& dir);

// Leader election over a shared lock file.
//
// Layout of the file:
//   [0, 4)  big-endian port of the leader's listener ("data" region)
//   [4, 5)  sentinel byte, never read ("instance" region)
//
// The data region is locked (blocking) by anyone about to read or write the
// port. The instance region is try-locked right after: whoever gets it is the
// leader and keeps it for its whole lifetime. The leader keeps the data lock
// until the port is published, so a follower that got the data lock always
// reads a complete port.
class LockCoordinator {
public:
    // Elect for app_id under options.resolved_lock_dir().
    static Result<std::unique_ptr<LockCoordinator>> acquire(const std::string& app_id,
                                                            const InstanceOptions& options);

    // Elect on an explicit lock file path.
    static Result<std::unique_ptr<LockCoordinator>> acquire_path(const fs::path& lock_path);

    ~LockCoordinator();

    LockCoordinator(const LockCoordinator&) = delete;
    LockCoordinator& operator=(const LockCoordinator&) = delete;

    Role role() const { return role_; }
    bool is_leader() const { return role_ == Role::Leader; }
    const fs::path& path() const { return path_; }

    // Leader: write the port, force it to disk, release the data lock.
    Result<void> publish_port(int port);

    // Follower: release the data lock and read the published port.
    Result<int> read_port();

    // Leader: delete the file, release the instance lock, close the file, in
    // that order. Follower: close the file. Idempotent.
    Result<void> release();

private:
    LockCoordinator(fs::path path, Role role,
                    std::unique_ptr<platform::LockFile> file,
                    std::unique_ptr<platform::ExclusiveRegionLock> data_lock,
                    std::unique_ptr<platform::ExclusiveRegionLock> instance_lock);

    fs::path path_;
    Role role_;
    bool released_ = false;
    // Declared before the locks: they reference it and must go first.
    std::unique_ptr<platform::LockFile> file_;
    std::unique_ptr<platform::ExclusiveRegionLock> data_lock_;
    std::unique_ptr<platform::ExclusiveRegionLock> instance_lock_;
};
