#include "region_lock.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Open file description locks belong to the open file, not the process:
// closing an unrelated descriptor cannot drop them and two opens within one
// process exclude each other. Classic record locks are the fallback.
#ifdef F_OFD_SETLK
#  define SOLOIST_SETLK  F_OFD_SETLK
#  define SOLOIST_SETLKW F_OFD_SETLKW
#else
#  define SOLOIST_SETLK  F_SETLK
#  define SOLOIST_SETLKW F_SETLKW
#endif

namespace platform {

static std::string errno_text() {
    return std::strerror(errno);
}

// ── LockFile ─────────────────────────────────────────────────

Result<std::unique_ptr<LockFile>> LockFile::open(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<std::unique_ptr<LockFile>>::Err(
                fmt::format("Cannot create {}: {}", path.parent_path().string(), ec.message()));
        }
    }

    int fd;
    do {
        fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return Result<std::unique_ptr<LockFile>>::Err(
            fmt::format("Cannot open lock file {}: {}", path.string(), errno_text()));
    }

    std::unique_ptr<LockFile> file(new LockFile(path));
    file->fd_ = fd;
    return Result<std::unique_ptr<LockFile>>::Ok(std::move(file));
}

LockFile::~LockFile() {
    close();
}

Result<void> LockFile::write_at(int64_t offset, const char* buf, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(fmt::format("Write to {} failed: {}", path_.string(), errno_text()));
        }
        done += static_cast<std::size_t>(n);
    }
    return Result<void>::Ok();
}

Result<std::size_t> LockFile::read_at(int64_t offset, char* buf, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<std::size_t>::Err(
                fmt::format("Read from {} failed: {}", path_.string(), errno_text()));
        }
        if (n == 0) break;
        done += static_cast<std::size_t>(n);
    }
    return Result<std::size_t>::Ok(done);
}

Result<void> LockFile::sync() {
    if (::fsync(fd_) != 0) {
        return Result<void>::Err(fmt::format("fsync({}) failed: {}", path_.string(), errno_text()));
    }
    return Result<void>::Ok();
}

bool LockFile::still_linked() const {
    if (fd_ < 0) return false;
    struct stat by_fd;
    struct stat by_path;
    if (::fstat(fd_, &by_fd) != 0) return false;
    if (::stat(path_.c_str(), &by_path) != 0) return false;
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

Result<void> LockFile::remove() {
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        return Result<void>::Err(fmt::format("Cannot delete {}: {}", path_.string(), errno_text()));
    }
    return Result<void>::Ok();
}

void LockFile::close() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
}

bool LockFile::is_open() const {
    return fd_ >= 0;
}

// ── ExclusiveRegionLock ──────────────────────────────────────

static struct flock region(short type, int64_t offset, int64_t length) {
    struct flock fl{};
    fl.l_type = type;
    fl.l_whence = SEEK_SET;
    fl.l_start = static_cast<off_t>(offset);
    fl.l_len = static_cast<off_t>(length);
    fl.l_pid = 0;   // required by OFD locks
    return fl;
}

ExclusiveRegionLock::ExclusiveRegionLock(LockFile& file, int64_t offset, int64_t length)
    : file_(file), offset_(offset), length_(length) {}

ExclusiveRegionLock::~ExclusiveRegionLock() {
    if (held_ && file_.is_open()) {
        struct flock fl = region(F_UNLCK, offset_, length_);
        ::fcntl(file_.fd_, SOLOIST_SETLK, &fl);
    }
}

Result<void> ExclusiveRegionLock::acquire_blocking() {
    if (held_) return Result<void>::Ok();

    struct flock fl = region(F_WRLCK, offset_, length_);
    while (::fcntl(file_.fd_, SOLOIST_SETLKW, &fl) != 0) {
        if (errno == EINTR) continue;
        return Result<void>::Err(fmt::format("Lock of {} [{}, +{}) failed: {}",
                                             file_.path().string(), offset_, length_, errno_text()));
    }
    held_ = true;
    return Result<void>::Ok();
}

Result<bool> ExclusiveRegionLock::try_acquire() {
    if (held_) return Result<bool>::Ok(true);

    struct flock fl = region(F_WRLCK, offset_, length_);
    while (::fcntl(file_.fd_, SOLOIST_SETLK, &fl) != 0) {
        if (errno == EINTR) continue;
        if (errno == EACCES || errno == EAGAIN) {
            return Result<bool>::Ok(false);
        }
        return Result<bool>::Err(fmt::format("Try-lock of {} [{}, +{}) failed: {}",
                                             file_.path().string(), offset_, length_, errno_text()));
    }
    held_ = true;
    return Result<bool>::Ok(true);
}

Result<void> ExclusiveRegionLock::release() {
    if (!held_) return Result<void>::Ok();
    held_ = false;
    if (!file_.is_open()) return Result<void>::Ok();

    struct flock fl = region(F_UNLCK, offset_, length_);
    if (::fcntl(file_.fd_, SOLOIST_SETLK, &fl) != 0) {
        return Result<void>::Err(fmt::format("Unlock of {} [{}, +{}) failed: {}",
                                             file_.path().string(), offset_, length_, errno_text()));
    }
    return Result<void>::Ok();
}

} // namespace platform
