#pragma once

#include <weft/abi/canonical.hpp>
#include <weft/abi/policy.hpp>
#include <weft/cache/dir_cache.hpp>
#include <weft/config.hpp>
#include <weft/result.hpp>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace weft {

// One compiled class handed to the engine
struct ClassInput {
    std::string name;    // binary name, e.g. "com/acme/Widget"
    std::string module;  // originating module or archive, for reporting
    std::vector<uint8_t> bytes;
};

struct ClassFailure {
    std::string class_name;
    std::string module;
    WeftError error;
};

struct AvoidanceDiff {
    std::set<std::string> changed_api;   // different fingerprint, or new
    std::set<std::string> removed_api;   // gone since the previous generation
    std::set<std::string> unchanged;     // same fingerprint
};

struct AvoidanceReport {
    std::set<std::string> changed_api;
    std::set<std::string> removed_api;
    std::set<std::string> unchanged;
    std::vector<ClassFailure> failures;
    bool cache_rebuilt = false;  // no trustworthy previous generation existed

    // changed_api + removed_api
    std::set<std::string> invalidation() const;
    bool requires_recompilation() const {
        return !changed_api.empty() || !removed_api.empty();
    }
};

// Pure comparison of two generations. Fails with HashCollisionDetected if a
// class keeps its digest while its canonical bytes differ.
Result<AvoidanceDiff> diff_fingerprints(const abi::FingerprintMap& previous,
                                        const abi::FingerprintMap& current);

struct AvoidanceOptions {
    abi::AbiPolicy policy = abi::AbiPolicy::compile_avoidance();
    FailurePolicy on_malformed = FailurePolicy::AssumeChanged;

    static Result<AvoidanceOptions> from_config(const Config& cfg);
};

// Decides which classes of a compilation unit changed their ABI since the
// generation stored in a PersistentDirectoryCache, and stores the new one.
class CompileAvoidance {
public:
    static constexpr const char* PayloadFile = "fingerprints.db";

    // Changes whenever the canonical encoding does
    static std::string validator_token();

    explicit CompileAvoidance(AvoidanceOptions options = {});

    // Extract, filter and hash each class. Unreadable classes land in
    // `failures` (or abort the call under FailurePolicy::Abort).
    Result<abi::FingerprintMap> fingerprint_all(const std::vector<ClassInput>& classes,
                                                std::vector<ClassFailure>& failures) const;

    // The cache must be open with LockMode::Exclusive
    Result<AvoidanceReport> run(PersistentDirectoryCache& cache,
                                const std::vector<ClassInput>& classes) const;

    // Cache settings for one compilation identity, wired to this engine.
    // Locking comes from `cfg`; the recorded ABI policy is this engine's.
    CacheSpec cache_spec(const std::filesystem::path& directory,
                         const std::string& identity,
                         const Config& cfg) const;

    const AvoidanceOptions& options() const { return options_; }

private:
    AvoidanceOptions options_;
};

} // namespace weft
