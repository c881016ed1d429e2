#include "region_lock.hpp"
#include <fmt/format.h>
#include <system_error>

#ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace fs = std::filesystem;

namespace platform {

static std::string win_error_text() {
    return fmt::format("Windows error {}", GetLastError());
}

static HANDLE as_handle(void* h) {
    return static_cast<HANDLE>(h);
}

static OVERLAPPED at_offset(int64_t offset) {
    OVERLAPPED ov = {};
    ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFF);
    ov.OffsetHigh = static_cast<DWORD>((offset >> 32) & 0xFFFFFFFF);
    return ov;
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

    // FILE_SHARE_DELETE lets the leader delete the file while others hold it open.
    HANDLE h = CreateFileW(path.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Result<std::unique_ptr<LockFile>>::Err(
            fmt::format("Cannot open lock file {}: {}", path.string(), win_error_text()));
    }

    std::unique_ptr<LockFile> file(new LockFile(path));
    file->handle_ = h;
    return Result<std::unique_ptr<LockFile>>::Ok(std::move(file));
}

LockFile::~LockFile() {
    close();
}

Result<void> LockFile::write_at(int64_t offset, const char* buf, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        OVERLAPPED ov = at_offset(offset + static_cast<int64_t>(done));
        DWORD n = 0;
        if (!WriteFile(as_handle(handle_), buf + done, static_cast<DWORD>(len - done), &n, &ov)) {
            return Result<void>::Err(fmt::format("Write to {} failed: {}", path_.string(), win_error_text()));
        }
        done += n;
    }
    return Result<void>::Ok();
}

Result<std::size_t> LockFile::read_at(int64_t offset, char* buf, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        OVERLAPPED ov = at_offset(offset + static_cast<int64_t>(done));
        DWORD n = 0;
        if (!ReadFile(as_handle(handle_), buf + done, static_cast<DWORD>(len - done), &n, &ov)) {
            if (GetLastError() == ERROR_HANDLE_EOF) break;
            return Result<std::size_t>::Err(
                fmt::format("Read from {} failed: {}", path_.string(), win_error_text()));
        }
        if (n == 0) break;
        done += n;
    }
    return Result<std::size_t>::Ok(done);
}

Result<void> LockFile::sync() {
    if (!FlushFileBuffers(as_handle(handle_))) {
        return Result<void>::Err(fmt::format("Flush of {} failed: {}", path_.string(), win_error_text()));
    }
    return Result<void>::Ok();
}

bool LockFile::still_linked() const {
    // A deleted file stays "delete pending" until its last handle closes and
    // cannot be opened by name meanwhile.
    std::error_code ec;
    return handle_ != nullptr && fs::exists(path_, ec);
}

Result<void> LockFile::remove() {
    if (!DeleteFileW(path_.wstring().c_str()) && GetLastError() != ERROR_FILE_NOT_FOUND) {
        return Result<void>::Err(fmt::format("Cannot delete {}: {}", path_.string(), win_error_text()));
    }
    return Result<void>::Ok();
}

void LockFile::close() {
    if (handle_ == nullptr) return;
    CloseHandle(as_handle(handle_));
    handle_ = nullptr;
}

bool LockFile::is_open() const {
    return handle_ != nullptr;
}

// ── ExclusiveRegionLock ──────────────────────────────────────

ExclusiveRegionLock::ExclusiveRegionLock(LockFile& file, int64_t offset, int64_t length)
    : file_(file), offset_(offset), length_(length) {}

ExclusiveRegionLock::~ExclusiveRegionLock() {
    if (held_ && file_.is_open()) {
        OVERLAPPED ov = at_offset(offset_);
        UnlockFileEx(as_handle(file_.handle_), 0, static_cast<DWORD>(length_), 0, &ov);
    }
}

Result<void> ExclusiveRegionLock::acquire_blocking() {
    if (held_) return Result<void>::Ok();

    OVERLAPPED ov = at_offset(offset_);
    if (!LockFileEx(as_handle(file_.handle_), LOCKFILE_EXCLUSIVE_LOCK, 0,
                    static_cast<DWORD>(length_), 0, &ov)) {
        return Result<void>::Err(fmt::format("Lock of {} [{}, +{}) failed: {}",
                                             file_.path().string(), offset_, length_, win_error_text()));
    }
    held_ = true;
    return Result<void>::Ok();
}

Result<bool> ExclusiveRegionLock::try_acquire() {
    if (held_) return Result<bool>::Ok(true);

    OVERLAPPED ov = at_offset(offset_);
    if (!LockFileEx(as_handle(file_.handle_), LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, static_cast<DWORD>(length_), 0, &ov)) {
        if (GetLastError() == ERROR_LOCK_VIOLATION) {
            return Result<bool>::Ok(false);
        }
        return Result<bool>::Err(fmt::format("Try-lock of {} [{}, +{}) failed: {}",
                                             file_.path().string(), offset_, length_, win_error_text()));
    }
    held_ = true;
    return Result<bool>::Ok(true);
}

Result<void> ExclusiveRegionLock::release() {
    if (!held_) return Result<void>::Ok();
    held_ = false;
    if (!file_.is_open()) return Result<void>::Ok();

    OVERLAPPED ov = at_offset(offset_);
    if (!UnlockFileEx(as_handle(file_.handle_), 0, static_cast<DWORD>(length_), 0, &ov)) {
        return Result<void>::Err(fmt::format("Unlock of {} [{}, +{}) failed: {}",
                                             file_.path().string(), offset_, length_, win_error_text()));
    }
    return Result<void>::Ok();
}

} // namespace platform
