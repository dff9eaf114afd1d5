#include <weft/cache/dir_cache.hpp>
#include <weft/cache/cache_properties.hpp>
#include <weft/log.hpp>

#include <algorithm>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace weft {

const char* lock_strategy_name(LockStrategy s) {
    switch (s) {
        case LockStrategy::Eager:    return "eager";
        case LockStrategy::OnDemand: return "on-demand";
    }
    return "unknown";
}

const char* lock_target_name(LockTarget t) {
    switch (t) {
        case LockTarget::Default:        return "default";
        case LockTarget::CacheDirectory: return "cache-dir";
    }
    return "unknown";
}

const char* cache_state_name(CacheState s) {
    switch (s) {
        case CacheState::Closed:        return "closed";
        case CacheState::Opening:       return "opening";
        case CacheState::Validating:    return "validating";
        case CacheState::Rebuilding:    return "rebuilding";
        case CacheState::Open:          return "open";
        case CacheState::Closing:       return "closing";
        case CacheState::ClosedUnclean: return "closed-unclean";
    }
    return "unknown";
}

static const char* lock_file_name(LockTarget t) {
    return t == LockTarget::CacheDirectory ? "cache.lock" : "cache.properties.lock";
}

static WeftError stale(const std::string& why) {
    return WeftError(WeftError::StaleOrUncleanCache, why);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

PersistentDirectoryCache::PersistentDirectoryCache(CacheSpec spec)
    : spec_(std::move(spec)),
      lock_(spec_.directory / lock_file_name(spec_.target)) {}

PersistentDirectoryCache::~PersistentDirectoryCache() {
    auto r = close();
    if (r.is_err()) {
        log::warn("closing cache %s: %s", spec_.directory.c_str(),
                  r.error().format().c_str());
    }
}

fs::path PersistentDirectoryCache::properties_path() const {
    return spec_.directory / PropertiesFile;
}

fs::path PersistentDirectoryCache::lock_path() const {
    return lock_.path();
}

fs::path PersistentDirectoryCache::payload_path(const std::string& name) const {
    return spec_.directory / name;
}

Status PersistentDirectoryCache::open() {
    if (state_ != CacheState::Closed && state_ != CacheState::ClosedUnclean) {
        return WeftError(WeftError::InvalidArg,
            "cache " + spec_.directory.string() + " is already " + cache_state_name(state_));
    }
    state_ = CacheState::Opening;
    rebuilt_ = false;
    dirty_ = false;
    poisoned_ = false;

    std::error_code ec;
    fs::create_directories(spec_.directory, ec);
    if (ec || !fs::is_directory(spec_.directory, ec)) {
        state_ = CacheState::Closed;
        return WeftError(WeftError::CacheInitializationFailure,
            "cannot create cache directory " + spec_.directory.string()
            + (ec ? ": " + ec.message() : std::string()));
    }

    auto locked = lock(spec_.lock.mode);
    if (locked.is_err()) {
        state_ = CacheState::Closed;
        return locked;
    }

    auto valid = ensure_valid();
    if (valid.is_err()) {
        lock_.release();
        state_ = (poisoned_ || dirty_) ? CacheState::ClosedUnclean : CacheState::Closed;
        return valid;
    }

    state_ = CacheState::Open;
    if (spec_.lock.strategy == LockStrategy::OnDemand) {
        lock_.release();
    }
    log::debug("opened cache %s (%s, %s)", spec_.directory.c_str(),
               lock_mode_name(spec_.lock.mode), lock_strategy_name(spec_.lock.strategy));
    return ok_status();
}

Status PersistentDirectoryCache::close() {
    if (state_ == CacheState::Closed || state_ == CacheState::ClosedUnclean) {
        return ok_status();
    }
    state_ = CacheState::Closing;
    Status result = ok_status();

    if (spec_.on_finished) {
        if (!lock_.is_held()) result = lock(spec_.lock.mode);
        if (result.is_ok()) result = spec_.on_finished(*this);
    }

    if (lock_.is_held() && dirty_ && !poisoned_) {
        auto marked = write_properties(true);
        if (marked.is_ok()) {
            dirty_ = false;
        } else if (result.is_ok()) {
            result = marked;
        }
    }
    lock_.release();

    state_ = (poisoned_ || dirty_) ? CacheState::ClosedUnclean : CacheState::Closed;
    if (state_ == CacheState::ClosedUnclean) {
        log::warn("cache %s closed without a clean marker; it will be rebuilt on next open",
                  spec_.directory.c_str());
    }
    return result;
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

Status PersistentDirectoryCache::read(const std::function<Status()>& action) {
    if (!is_open()) {
        return WeftError(WeftError::InvalidArg,
            "cache " + spec_.directory.string() + " is not open");
    }
    if (spec_.lock.strategy == LockStrategy::Eager) {
        return action();
    }

    WEFT_TRY(lock(spec_.lock.mode));
    auto valid = ensure_valid();
    state_ = CacheState::Open;
    Status result = valid.is_ok() ? action() : valid;
    lock_.release();
    return result;
}

Status PersistentDirectoryCache::write(const std::function<Status()>& action) {
    if (!is_open()) {
        return WeftError(WeftError::InvalidArg,
            "cache " + spec_.directory.string() + " is not open");
    }
    if (spec_.lock.mode != LockMode::Exclusive) {
        return WeftError(WeftError::InvalidArg,
            "cache " + spec_.directory.string() + " was opened for shared access",
            "open it with LockMode::Exclusive to modify it");
    }

    bool on_demand = spec_.lock.strategy == LockStrategy::OnDemand;
    if (on_demand) {
        WEFT_TRY(lock(LockMode::Exclusive));
        auto valid = ensure_valid();
        state_ = CacheState::Open;
        if (valid.is_err()) {
            lock_.release();
            return valid;
        }
    }

    auto marked = mark_dirty();
    if (marked.is_err()) {
        if (on_demand) lock_.release();
        return marked;
    }

    auto result = action();
    if (result.is_err()) {
        poisoned_ = true;
        log::warn("write to cache %s failed; leaving it marked unclean",
                  spec_.directory.c_str());
    } else if (on_demand) {
        result = write_properties(true);
        if (result.is_ok()) dirty_ = false;
    }

    if (on_demand) lock_.release();
    return result;
}

// ---------------------------------------------------------------------------
// Validation and rebuild
// ---------------------------------------------------------------------------

Status PersistentDirectoryCache::lock(LockMode mode) {
    return lock_.acquire(mode, spec_.lock.timeout);
}

Status PersistentDirectoryCache::validate() const {
    auto loaded = CacheProperties::load(properties_path());
    if (loaded.is_err()) {
        const auto& err = loaded.error();
        if (err.code == WeftError::NotFound) return stale("no " + std::string(PropertiesFile));
        if (err.code == WeftError::Parse) return stale("unreadable properties: " + err.message);
        return WeftError(WeftError::CacheInitializationFailure, err.message);
    }

    const CacheProperties& p = loaded.value();
    if (p.schema != SchemaVersion) {
        return stale("schema version '" + p.schema + "', expected '" + SchemaVersion + "'");
    }
    if (!p.clean) {
        log::warn("cache %s was not closed cleanly", spec_.directory.c_str());
        return stale("previous session did not close cleanly");
    }
    if (p.validator != spec_.validator.token) {
        return stale("validator token '" + p.validator + "', expected '"
                     + spec_.validator.token + "'");
    }
    if (p.identity != spec_.identity) {
        return stale("identity '" + p.identity + "', expected '" + spec_.identity + "'");
    }
    if (p.lock_target != lock_target_name(spec_.target)) {
        return stale("lock target changed");
    }
    if (p.properties != spec_.properties) {
        return stale("cache properties changed");
    }
    if (spec_.validator.is_valid && !spec_.validator.is_valid()) {
        return stale("validator rejected the cache contents");
    }
    return ok_status();
}

// Runs with the lock held. Leaves the lock in the mode it found it in.
Status PersistentDirectoryCache::ensure_valid() {
    LockMode wanted = lock_.held_mode().value_or(spec_.lock.mode);
    state_ = CacheState::Validating;

    auto valid = validate();
    if (valid.is_ok() || valid.error().code != WeftError::StaleOrUncleanCache) {
        return valid;
    }

    if (wanted != LockMode::Exclusive) {
        WEFT_TRY(escalate(wanted, valid));
    }

    if (valid.is_err()) {
        log::info("rebuilding cache %s: %s", spec_.directory.c_str(),
                  valid.error().message.c_str());
        WEFT_TRY(rebuild());
    }

    if (wanted != LockMode::Exclusive) {
        WEFT_TRY(lock(wanted));
    }
    return ok_status();
}

// Trades a shared lock on a stale cache for the exclusive one. Another shared
// opener may win the exclusive lock, rebuild and keep holding it shared, so
// a failed attempt re-takes `wanted` and validates again instead of waiting
// for an exclusive lock that may never come. On return `valid` is ok when
// someone else rebuilt (lock held as `wanted`) or still stale when the
// exclusive lock is held.
Status PersistentDirectoryCache::escalate(LockMode wanted, Status& valid) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + spec_.lock.timeout;
    auto backoff = std::chrono::milliseconds(1);

    lock_.release();
    while (true) {
        auto got = lock_.try_acquire(LockMode::Exclusive);
        WEFT_TRY(got);
        if (got.value()) {
            valid = validate();
            if (valid.is_err() && valid.error().code != WeftError::StaleOrUncleanCache) {
                return valid;
            }
            return ok_status();
        }

        WEFT_TRY(lock(wanted));
        valid = validate();
        if (valid.is_ok()) return ok_status();
        if (valid.error().code != WeftError::StaleOrUncleanCache) return valid;
        lock_.release();

        auto now = clock::now();
        if (now >= deadline) {
            return WeftError(WeftError::LockTimeout,
                "timed out after " + std::to_string(spec_.lock.timeout.count())
                + "ms waiting to rebuild " + spec_.directory.string(),
                "another process keeps the stale cache locked; retry later");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(backoff, left));
        backoff = std::min(backoff * 2, std::chrono::milliseconds(50));
    }
}

Status PersistentDirectoryCache::rebuild() {
    state_ = CacheState::Rebuilding;

    // From here until the final marker, a crash leaves the cache unclean
    WEFT_TRY(write_properties(false));
    dirty_ = true;
    WEFT_TRY(clear_payload());

    if (spec_.initializer) {
        auto init = spec_.initializer(*this);
        if (init.is_err()) {
            poisoned_ = true;
            return init;
        }
    }

    WEFT_TRY(write_properties(true));
    dirty_ = false;
    poisoned_ = false;
    rebuilt_ = true;
    return ok_status();
}

Status PersistentDirectoryCache::clear_payload() {
    std::error_code ec;
    std::vector<fs::path> doomed;
    fs::directory_iterator it(spec_.directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name == PropertiesFile || name == lock_.path().filename().string()) {
            continue;
        }
        doomed.push_back(it->path());
    }
    if (ec) {
        return WeftError(WeftError::CacheInitializationFailure,
            "cannot list cache directory " + spec_.directory.string() + ": " + ec.message());
    }

    for (const auto& path : doomed) {
        fs::remove_all(path, ec);
        if (ec) {
            return WeftError(WeftError::CacheInitializationFailure,
                "cannot remove stale cache entry " + path.string() + ": " + ec.message());
        }
    }
    return ok_status();
}

Status PersistentDirectoryCache::write_properties(bool clean) {
    CacheProperties p;
    p.schema = SchemaVersion;
    p.identity = spec_.identity;
    p.validator = spec_.validator.token;
    p.lock_target = lock_target_name(spec_.target);
    p.clean = clean;
    p.properties = spec_.properties;

    auto saved = p.save(properties_path());
    if (saved.is_err()) {
        return WeftError(WeftError::CacheInitializationFailure, saved.error().message,
                         "check that the cache directory is writable");
    }
    return ok_status();
}

Status PersistentDirectoryCache::mark_dirty() {
    if (dirty_) return ok_status();
    WEFT_TRY(write_properties(false));
    dirty_ = true;
    return ok_status();
}

} // namespace weft
