#pragma once

#include <weft/abi/canonical.hpp>
#include <weft/result.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace weft {

// One generation of fingerprints for a compilation identity, kept in an
// SQLite database inside a PersistentDirectoryCache directory. The store
// does no locking of its own beyond SQLite's; callers use it from inside
// PersistentDirectoryCache::read()/write().
class FingerprintStore {
public:
    FingerprintStore();
    ~FingerprintStore();
    FingerprintStore(FingerprintStore&&) noexcept;
    FingerprintStore& operator=(FingerprintStore&&) noexcept;

    // A database that cannot be opened or set up is deleted and recreated;
    // recreated() then reports true.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    bool recreated() const;

    Result<abi::FingerprintMap> load();
    Result<abi::Fingerprint> lookup(const std::string& class_name);

    // Replaces the stored generation in a single transaction
    Status replace_all(const abi::FingerprintMap& generation);

    Status clear();
    Result<int64_t> count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace weft
