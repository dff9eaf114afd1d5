#pragma once

#include <weft/result.hpp>
#include <chrono>
#include <filesystem>
#include <optional>

namespace weft {

enum class LockMode {
    Shared,     // concurrent readers, no writer
    Exclusive   // one holder
};

const char* lock_mode_name(LockMode mode);

// Advisory lock on a file, backed by flock(2). Each FileLock owns its own
// open file description, so two FileLock objects on the same path exclude
// each other even inside one process. The kernel drops the lock when the
// holder dies; noticing that the holder died mid-write is the caller's job.
class FileLock {
public:
    explicit FileLock(std::filesystem::path path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    // Non-blocking; Ok(false) when another handle holds a conflicting lock.
    // Calling it while holding the lock converts the lock to `mode`.
    Result<bool> try_acquire(LockMode mode);

    // Polls with backoff until `timeout` elapses, then fails with LockTimeout
    Status acquire(LockMode mode, std::chrono::milliseconds timeout);

    void release();

    bool is_held() const { return mode_.has_value(); }
    std::optional<LockMode> held_mode() const { return mode_; }

    // True if some other handle holds a lock that would keep this one from
    // taking it exclusively. Not answerable while this handle holds it shared.
    Result<bool> is_held_by_other_process() const;

    const std::filesystem::path& path() const { return path_; }

private:
    Status ensure_open();

    std::filesystem::path path_;
    int fd_ = -1;
    std::optional<LockMode> mode_;
};

} // namespace weft
