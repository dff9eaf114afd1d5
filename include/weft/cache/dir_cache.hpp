#pragma once

#include <weft/cache/file_lock.hpp>
#include <weft/result.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace weft {

enum class LockStrategy {
    Eager,     // lock held from open() to close()
    OnDemand   // lock taken per read()/write() and released in between
};

enum class LockTarget {
    Default,         // <dir>/cache.properties.lock
    CacheDirectory   // <dir>/cache.lock
};

enum class CacheState {
    Closed,
    Opening,
    Validating,
    Rebuilding,
    Open,
    Closing,
    ClosedUnclean   // a write did not finish; the next opener rebuilds
};

const char* lock_strategy_name(LockStrategy s);
const char* lock_target_name(LockTarget t);
const char* cache_state_name(CacheState s);

struct LockOptions {
    LockMode mode = LockMode::Exclusive;
    LockStrategy strategy = LockStrategy::Eager;
    std::chrono::milliseconds timeout{60000};
};

// Expected content version. A different token on disk, or `is_valid`
// returning false, makes the cache rebuild itself.
struct CacheValidator {
    std::string token;
    std::function<bool()> is_valid;
};

class PersistentDirectoryCache;

using CacheInitializer = std::function<Status(PersistentDirectoryCache&)>;
using CacheFinisher = std::function<Status(PersistentDirectoryCache&)>;

struct CacheSpec {
    std::filesystem::path directory;
    std::string identity;
    CacheValidator validator;
    // Persisted next to the token; any difference forces a rebuild
    std::map<std::string, std::string> properties;
    LockTarget target = LockTarget::Default;
    LockOptions lock;
    CacheInitializer initializer;   // runs once per rebuild, lock held
    CacheFinisher on_finished;      // runs in close(), lock held
};

// A directory owned by one cache identity:
//
//   <dir>/cache.properties        schema, validator token, clean-close flag
//   <dir>/cache.properties.lock   advisory lock (or cache.lock)
//   <dir>/...                     payload, owned by the caller
//
// open() validates the properties and, if they are missing, stale or left
// unclean by a crashed writer, wipes the payload and runs the initializer
// before anyone else can see the directory. The clean flag is cleared before
// the first write of a session and set again only when the session closes
// (eager) or the write returns (on-demand).
class PersistentDirectoryCache {
public:
    static constexpr const char* PropertiesFile = "cache.properties";
    static constexpr const char* SchemaVersion = "1";

    explicit PersistentDirectoryCache(CacheSpec spec);
    ~PersistentDirectoryCache();

    PersistentDirectoryCache(const PersistentDirectoryCache&) = delete;
    PersistentDirectoryCache& operator=(const PersistentDirectoryCache&) = delete;

    // LockTimeout if another process holds the lock for too long,
    // CacheInitializationFailure if the directory cannot be set up, or
    // whatever the initializer returned.
    Status open();

    // Idempotent
    Status close();

    // Runs `action` with at least a shared lock held
    Status read(const std::function<Status()>& action);

    // Runs `action` with the exclusive lock held; requires LockMode::Exclusive
    Status write(const std::function<Status()>& action);

    CacheState state() const { return state_; }
    bool is_open() const { return state_ == CacheState::Open; }
    bool was_rebuilt() const { return rebuilt_; }
    bool holds_lock() const { return lock_.is_held(); }

    const std::filesystem::path& directory() const { return spec_.directory; }
    const std::string& identity() const { return spec_.identity; }
    const LockOptions& lock_options() const { return spec_.lock; }
    std::filesystem::path properties_path() const;
    std::filesystem::path lock_path() const;
    std::filesystem::path payload_path(const std::string& name) const;

private:
    Status lock(LockMode mode);
    Status validate() const;
    Status ensure_valid();
    Status escalate(LockMode wanted, Status& valid);
    Status rebuild();
    Status clear_payload();
    Status write_properties(bool clean);
    Status mark_dirty();

    CacheSpec spec_;
    FileLock lock_;
    CacheState state_ = CacheState::Closed;
    bool rebuilt_ = false;
    bool dirty_ = false;      // clean flag cleared on disk by this session
    bool poisoned_ = false;   // a write failed part way
};

} // namespace weft
