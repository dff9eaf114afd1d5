#include <weft/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace weft {

const char* failure_policy_name(FailurePolicy p) {
    switch (p) {
        case FailurePolicy::AssumeChanged: return "assume-changed";
        case FailurePolicy::Abort:         return "abort";
    }
    return "unknown";
}

static WeftError bad_value(const std::string& key, const std::string& value,
                           const std::string& expected) {
    return WeftError{WeftError::Config,
        "invalid value '" + value + "' for " + key, "expected " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeftError{WeftError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["lock-mode"].value<std::string>()) {
            if (*v == "shared") cfg.lock.mode = LockMode::Shared;
            else if (*v == "exclusive") cfg.lock.mode = LockMode::Exclusive;
            else return bad_value("cache.lock-mode", *v, "\"shared\" or \"exclusive\"");
            cfg.lock_mode_set = true;
        }
        if (auto v = (*cache)["lock-strategy"].value<std::string>()) {
            if (*v == "eager") cfg.lock.strategy = LockStrategy::Eager;
            else if (*v == "on-demand") cfg.lock.strategy = LockStrategy::OnDemand;
            else return bad_value("cache.lock-strategy", *v, "\"eager\" or \"on-demand\"");
            cfg.lock_strategy_set = true;
        }
        if (auto v = (*cache)["lock-timeout-ms"].value<int64_t>()) {
            if (*v < 0) return bad_value("cache.lock-timeout-ms", std::to_string(*v),
                                         "a non-negative number of milliseconds");
            cfg.lock.timeout = std::chrono::milliseconds(*v);
            cfg.lock_timeout_set = true;
        }
        if (auto v = (*cache)["lock-target"].value<std::string>()) {
            if (*v == "default") cfg.lock_target = LockTarget::Default;
            else if (*v == "cache-dir") cfg.lock_target = LockTarget::CacheDirectory;
            else return bad_value("cache.lock-target", *v, "\"default\" or \"cache-dir\"");
            cfg.lock_target_set = true;
        }
    }

    // [abi] section
    if (auto abi = doc["abi"].as_table()) {
        if (auto v = (*abi)["policy"].value<std::string>()) {
            if (*v != "all" && *v != "compile-avoidance" && *v != "public-api") {
                return bad_value("abi.policy", *v,
                                 "\"all\", \"compile-avoidance\" or \"public-api\"");
            }
            cfg.abi_policy = *v;
            cfg.abi_policy_set = true;
        }
        if (auto v = (*abi)["include-private"].value<bool>()) cfg.include_private = *v;
        if (auto v = (*abi)["include-synthetic"].value<bool>()) cfg.include_synthetic = *v;
        if (auto v = (*abi)["include-bridge"].value<bool>()) cfg.include_bridge = *v;
        if (auto v = (*abi)["include-static-init"].value<bool>()) cfg.include_static_init = *v;
    }

    // [engine] section
    if (auto engine = doc["engine"].as_table()) {
        if (auto v = (*engine)["on-malformed"].value<std::string>()) {
            if (*v == "assume-changed") cfg.on_malformed = FailurePolicy::AssumeChanged;
            else if (*v == "abort") cfg.on_malformed = FailurePolicy::Abort;
            else return bad_value("engine.on-malformed", *v, "\"assume-changed\" or \"abort\"");
            cfg.on_malformed_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return bad_value("log.level", *v, "trace, debug, info, warn or error");
            }
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeftError{WeftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) r.error().file = path;
    return r;
}

void Config::merge(const Config& other) {
    if (other.lock_mode_set) {
        lock.mode = other.lock.mode;
        lock_mode_set = true;
    }
    if (other.lock_strategy_set) {
        lock.strategy = other.lock.strategy;
        lock_strategy_set = true;
    }
    if (other.lock_timeout_set) {
        lock.timeout = other.lock.timeout;
        lock_timeout_set = true;
    }
    if (other.lock_target_set) {
        lock_target = other.lock_target;
        lock_target_set = true;
    }
    if (other.abi_policy_set) {
        abi_policy = other.abi_policy;
        abi_policy_set = true;
    }
    if (other.include_private) include_private = other.include_private;
    if (other.include_synthetic) include_synthetic = other.include_synthetic;
    if (other.include_bridge) include_bridge = other.include_bridge;
    if (other.include_static_init) include_static_init = other.include_static_init;
    if (other.on_malformed_set) {
        on_malformed = other.on_malformed;
        on_malformed_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.weft/config.toml";
}

} // namespace weft
