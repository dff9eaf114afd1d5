#pragma once

#include <weft/result.hpp>
#include <filesystem>
#include <map>
#include <string>

namespace weft {

// Contents of <cache-dir>/cache.properties, stored as TOML:
//
//   schema = "1"
//   identity = "compile:main"
//   validator = "abi-v1"
//   lock-target = "default"
//   clean = true
//
//   [properties]
//   jdk = "21"
struct CacheProperties {
    std::string schema;
    std::string identity;
    std::string validator;
    std::string lock_target;
    bool clean = false;
    std::map<std::string, std::string> properties;

    static Result<CacheProperties> parse(const std::string& toml_str);

    // NotFound if the file does not exist
    static Result<CacheProperties> load(const std::filesystem::path& path);

    std::string to_toml() const;

    // Written to a sibling temp file and renamed over `path`
    Status save(const std::filesystem::path& path) const;
};

} // namespace weft
