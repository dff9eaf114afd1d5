#include <weft/cache/cache_properties.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace weft {

Result<CacheProperties> CacheProperties::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeftError{WeftError::Parse,
            std::string("cache properties parse error: ") + e.what()};
    }

    CacheProperties props;
    if (auto v = doc["schema"].value<std::string>()) props.schema = *v;
    if (auto v = doc["identity"].value<std::string>()) props.identity = *v;
    if (auto v = doc["validator"].value<std::string>()) props.validator = *v;
    if (auto v = doc["lock-target"].value<std::string>()) props.lock_target = *v;
    // A missing flag reads as unclean
    if (auto v = doc["clean"].value<bool>()) props.clean = *v;

    if (auto tbl = doc["properties"].as_table()) {
        for (const auto& [key, val] : *tbl) {
            if (auto s = val.value<std::string>()) {
                props.properties[std::string(key)] = std::string(*s);
            }
        }
    }

    return Result<CacheProperties>::ok(std::move(props));
}

Result<CacheProperties> CacheProperties::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return WeftError{WeftError::NotFound, "no cache properties at " + path.string()};
        }
        return WeftError{WeftError::IO, "cannot read cache properties: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = parse(ss.str());
    if (r.is_err()) r.error().file = path.string();
    return r;
}

std::string CacheProperties::to_toml() const {
    toml::table doc;
    doc.insert("schema", schema);
    doc.insert("identity", identity);
    doc.insert("validator", validator);
    doc.insert("lock-target", lock_target);
    doc.insert("clean", clean);

    toml::table extra;
    for (const auto& [k, v] : properties) {
        extra.insert(k, v);
    }
    doc.insert("properties", std::move(extra));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

Status CacheProperties::save(const fs::path& path) const {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return WeftError{WeftError::IO, "cannot write " + tmp.string()};
        }
        out << to_toml();
        out.flush();
        if (!out) {
            return WeftError{WeftError::IO, "short write to " + tmp.string()};
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return WeftError{WeftError::IO,
            "cannot replace " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace weft
