#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <core/types.hpp>

namespace platform {

// An open read/write file that byte-range locks are taken on.
// Implemented in region_lock_posix.cpp / region_lock_win.cpp.
class LockFile {
public:
    // Open the file for read/write, creating it (and its directory) if absent.
    static Result<std::unique_ptr<LockFile>> open(const std::filesystem::path& path);

    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    // Positional I/O; neither moves a shared file offset.
    Result<void> write_at(int64_t offset, const char* buf, std::size_t len);
    Result<std::size_t> read_at(int64_t offset, char* buf, std::size_t len);

    // Force written data to stable storage.
    Result<void> sync();

    // True if the path still names this open file (it was not deleted or
    // replaced since we opened it).
    bool still_linked() const;

    // Delete the path. The open handle stays usable.
    Result<void> remove();

    // Close the handle; every lock taken through it is dropped.
    void close();

    bool is_open() const;
    const std::filesystem::path& path() const { return path_; }

private:
    explicit LockFile(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
#ifdef _WIN32
    void* handle_ = nullptr;   // HANDLE
#else
    int fd_ = -1;
#endif

    friend class ExclusiveRegionLock;
};

// Exclusive lock over [offset, offset + length) of a LockFile.
//
// Locks are owned by the open file (not the process) where the OS allows it,
// so two LockFile objects on the same path contend even inside one process.
// The lock is released on release(), on destruction, or when the file closes.
class ExclusiveRegionLock {
public:
    ExclusiveRegionLock(LockFile& file, int64_t offset, int64_t length);
    ~ExclusiveRegionLock();

    ExclusiveRegionLock(const ExclusiveRegionLock&) = delete;
    ExclusiveRegionLock& operator=(const ExclusiveRegionLock&) = delete;

    // Wait until the region is ours.
    Result<void> acquire_blocking();

    // Take the region if nobody holds it. Ok(false) = held elsewhere.
    Result<bool> try_acquire();

    // Idempotent.
    Result<void> release();

    bool held() const { return held_; }

private:
    LockFile& file_;
    int64_t offset_;
    int64_t length_;
    bool held_ = false;
};

} // namespace platform
