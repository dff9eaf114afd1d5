#pragma once

#include <weft/cache/dir_cache.hpp>
#include <weft/log.hpp>
#include <weft/result.hpp>
#include <optional>
#include <string>

namespace weft {

enum class FailurePolicy {
    AssumeChanged,  // an unreadable class is reported as changed
    Abort           // the first unreadable class fails the whole run
};

const char* failure_policy_name(FailurePolicy p);

// Settings from a weft TOML file. Each section tracks which keys were set
// explicitly so that merge() only overrides those.
struct Config {
    LockOptions lock;
    LockTarget lock_target = LockTarget::Default;

    std::string abi_policy = "compile-avoidance";
    std::optional<bool> include_private;
    std::optional<bool> include_synthetic;
    std::optional<bool> include_bridge;
    std::optional<bool> include_static_init;

    FailurePolicy on_malformed = FailurePolicy::AssumeChanged;
    log::Level log_level = log::Info;

    bool lock_mode_set = false;
    bool lock_strategy_set = false;
    bool lock_timeout_set = false;
    bool lock_target_set = false;
    bool abi_policy_set = false;
    bool on_malformed_set = false;
    bool log_level_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.weft/config.toml
std::string global_config_path();

} // namespace weft
