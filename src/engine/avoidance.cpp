#include <weft/avoidance.hpp>
#include <weft/abi/class_reader.hpp>
#include <weft/cache/fingerprint_store.hpp>
#include <weft/log.hpp>

#include <map>

namespace weft {

std::set<std::string> AvoidanceReport::invalidation() const {
    std::set<std::string> out = changed_api;
    out.insert(removed_api.begin(), removed_api.end());
    return out;
}

Result<AvoidanceDiff> diff_fingerprints(const abi::FingerprintMap& previous,
                                        const abi::FingerprintMap& current) {
    AvoidanceDiff diff;
    for (const auto& [name, fp] : current) {
        auto it = previous.find(name);
        if (it == previous.end() || it->second.digest != fp.digest) {
            diff.changed_api.insert(name);
            continue;
        }
        WEFT_TRY(abi::check_collision(it->second, fp));
        diff.unchanged.insert(name);
    }
    // A missing class is always an API change, whatever it used to hash to
    for (const auto& [name, fp] : previous) {
        if (current.find(name) == current.end()) diff.removed_api.insert(name);
    }
    return Result<AvoidanceDiff>::ok(std::move(diff));
}

Result<AvoidanceOptions> AvoidanceOptions::from_config(const Config& cfg) {
    auto policy = abi::AbiPolicy::by_name(cfg.abi_policy);
    WEFT_TRY(policy);

    AvoidanceOptions opts;
    opts.policy = std::move(policy).value();
    if (cfg.include_private) opts.policy.include_private = *cfg.include_private;
    if (cfg.include_synthetic) opts.policy.include_synthetic = *cfg.include_synthetic;
    if (cfg.include_bridge) opts.policy.include_bridge = *cfg.include_bridge;
    if (cfg.include_static_init) opts.policy.include_static_init = *cfg.include_static_init;
    opts.on_malformed = cfg.on_malformed;
    return Result<AvoidanceOptions>::ok(std::move(opts));
}

CompileAvoidance::CompileAvoidance(AvoidanceOptions options)
    : options_(std::move(options)) {}

std::string CompileAvoidance::validator_token() {
    return "weft-abi-" + std::to_string(abi::CanonicalFormatVersion);
}

Result<abi::FingerprintMap> CompileAvoidance::fingerprint_all(
        const std::vector<ClassInput>& classes,
        std::vector<ClassFailure>& failures) const {
    abi::FingerprintMap out;
    std::map<Digest, std::string> by_digest;

    for (const auto& input : classes) {
        if (input.name.empty()) {
            return WeftError(WeftError::InvalidArg,
                "class input from '" + input.module + "' has no name");
        }
        if (out.count(input.name)) {
            return WeftError(WeftError::Duplicate,
                "class " + input.name + " was given twice");
        }

        auto sig = abi::extract_class(input.bytes);
        if (sig.is_ok() && sig.value().name() != input.name) {
            sig = WeftError(WeftError::MalformedClassFormat,
                "class file declares " + sig.value().name() + ", expected " + input.name);
        }
        if (sig.is_err()) {
            WeftError err = std::move(sig).error();
            if (err.file.empty()) err.file = input.module;
            if (options_.on_malformed == FailurePolicy::Abort) return err;
            log::warn("cannot read %s (%s): %s; assuming its API changed",
                      input.name.c_str(), input.module.c_str(), err.message.c_str());
            failures.push_back(ClassFailure{input.name, input.module, std::move(err)});
            continue;
        }

        abi::Fingerprint fp = abi::fingerprint(options_.policy.apply(sig.value()));

        auto seen = by_digest.find(fp.digest);
        if (seen != by_digest.end()) {
            WEFT_TRY(abi::check_collision(out.at(seen->second), fp));
        }
        by_digest.emplace(fp.digest, input.name);
        out.emplace(input.name, std::move(fp));
    }

    return Result<abi::FingerprintMap>::ok(std::move(out));
}

Result<AvoidanceReport> CompileAvoidance::run(PersistentDirectoryCache& cache,
                                              const std::vector<ClassInput>& classes) const {
    AvoidanceReport report;
    auto current = fingerprint_all(classes, report.failures);
    WEFT_TRY(current);

    auto stored = cache.write([&]() -> Status {
        FingerprintStore store;
        WEFT_TRY(store.open(cache.payload_path(PayloadFile).string()));

        auto previous = store.load();
        WEFT_TRY(previous);
        report.cache_rebuilt = store.recreated()
            || (cache.was_rebuilt() && previous.value().empty());

        auto diff = diff_fingerprints(previous.value(), current.value());
        WEFT_TRY(diff);
        report.changed_api = std::move(diff.value().changed_api);
        report.removed_api = std::move(diff.value().removed_api);
        report.unchanged = std::move(diff.value().unchanged);

        // Unreadable classes are not stored, so they show up as changed
        // again next time too
        for (const auto& f : report.failures) {
            report.removed_api.erase(f.class_name);
            report.unchanged.erase(f.class_name);
            report.changed_api.insert(f.class_name);
        }

        return store.replace_all(current.value());
    });
    WEFT_TRY(stored);

    log::debug("%s: %zu changed, %zu removed, %zu unchanged, %zu unreadable",
               cache.identity().c_str(), report.changed_api.size(),
               report.removed_api.size(), report.unchanged.size(),
               report.failures.size());
    return Result<AvoidanceReport>::ok(std::move(report));
}

CacheSpec CompileAvoidance::cache_spec(const std::filesystem::path& directory,
                                       const std::string& identity,
                                       const Config& cfg) const {
    CacheSpec spec;
    spec.directory = directory;
    spec.identity = identity;
    spec.validator.token = validator_token();
    // Fingerprints taken under another policy are not comparable
    spec.properties["abi-policy"] = options_.policy.describe();
    spec.target = cfg.lock_target;
    spec.lock = cfg.lock;
    spec.initializer = [](PersistentDirectoryCache& c) -> Status {
        FingerprintStore store;
        WEFT_TRY(store.open(c.payload_path(PayloadFile).string()));
        return store.clear();
    };
    return spec;
}

} // namespace weft
