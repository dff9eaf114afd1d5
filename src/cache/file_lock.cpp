#include <weft/cache/file_lock.hpp>
#include <weft/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace weft {

const char* lock_mode_name(LockMode mode) {
    switch (mode) {
        case LockMode::Shared:    return "shared";
        case LockMode::Exclusive: return "exclusive";
    }
    return "unknown";
}

static int flock_op(LockMode mode) {
    return mode == LockMode::Exclusive ? LOCK_EX : LOCK_SH;
}

// Opens (creating if needed) the lock file; -1 with errno set on failure
static int open_lock_file(const std::filesystem::path& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

FileLock::FileLock(std::filesystem::path path) : path_(std::move(path)) {}

FileLock::~FileLock() {
    release();
    if (fd_ >= 0) ::close(fd_);
}

FileLock::FileLock(FileLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), mode_(other.mode_) {
    other.fd_ = -1;
    other.mode_.reset();
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        if (fd_ >= 0) ::close(fd_);
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        mode_ = other.mode_;
        other.fd_ = -1;
        other.mode_.reset();
    }
    return *this;
}

Status FileLock::ensure_open() {
    if (fd_ >= 0) return ok_status();
    fd_ = open_lock_file(path_);
    if (fd_ < 0) {
        return WeftError(WeftError::CacheInitializationFailure,
            "cannot open lock file " + path_.string() + ": " + std::strerror(errno),
            "check that the cache directory exists and is writable");
    }
    return ok_status();
}

Result<bool> FileLock::try_acquire(LockMode mode) {
    WEFT_TRY(ensure_open());
    if (mode_ == mode) return Result<bool>::ok(true);

    int rc;
    do {
        rc = ::flock(fd_, flock_op(mode) | LOCK_NB);
    } while (rc != 0 && errno == EINTR);

    if (rc == 0) {
        mode_ = mode;
        return Result<bool>::ok(true);
    }
    if (errno == EWOULDBLOCK) {
        // A failed conversion may have dropped the old lock (flock(2))
        if (mode_) release();
        return Result<bool>::ok(false);
    }
    return WeftError(WeftError::IO,
        "flock failed on " + path_.string() + ": " + std::strerror(errno));
}

Status FileLock::acquire(LockMode mode, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + timeout;
    auto backoff = std::chrono::milliseconds(1);
    bool announced = false;

    while (true) {
        auto got = try_acquire(mode);
        WEFT_TRY(got);
        if (got.value()) {
            log::debug("acquired %s lock on %s", lock_mode_name(mode), path_.c_str());
            return ok_status();
        }
        if (!announced) {
            log::debug("waiting for %s lock on %s", lock_mode_name(mode), path_.c_str());
            announced = true;
        }
        auto now = clock::now();
        if (now >= deadline) break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(backoff, left));
        backoff = std::min(backoff * 2, std::chrono::milliseconds(50));
    }

    return WeftError(WeftError::LockTimeout,
        "timed out after " + std::to_string(timeout.count()) + "ms waiting for "
        + lock_mode_name(mode) + " lock on " + path_.string(),
        "another process is using this cache; retry later");
}

void FileLock::release() {
    if (!mode_) return;
    if (::flock(fd_, LOCK_UN) != 0) {
        log::warn("unlock of %s failed: %s", path_.c_str(), std::strerror(errno));
    }
    log::debug("released %s lock on %s", lock_mode_name(*mode_), path_.c_str());
    mode_.reset();
}

Result<bool> FileLock::is_held_by_other_process() const {
    if (mode_ == LockMode::Exclusive) return Result<bool>::ok(false);
    if (mode_ == LockMode::Shared) {
        return WeftError(WeftError::InvalidArg,
            "cannot probe " + path_.string() + " while holding it shared");
    }

    int probe = open_lock_file(path_);
    if (probe < 0) {
        return WeftError(WeftError::IO,
            "cannot open lock file " + path_.string() + ": " + std::strerror(errno));
    }
    int rc;
    do {
        rc = ::flock(probe, LOCK_EX | LOCK_NB);
    } while (rc != 0 && errno == EINTR);
    int err = errno;
    ::close(probe);  // also drops the probe lock if it was granted

    if (rc == 0) return Result<bool>::ok(false);
    if (err == EWOULDBLOCK) return Result<bool>::ok(true);
    return WeftError(WeftError::IO,
        "flock probe failed on " + path_.string() + ": " + std::strerror(err));
}

} // namespace weft
