// weft_check.cpp
//
// Decides whether the consumers of a set of compiled classes need to be
// recompiled since the last time the same cache directory saw them:
//
//     ./weft_check build/.weft out/com/acme/*.class
//     ./weft_check -v build/.weft out/com/acme/Widget.class
//
// Prints one invalidated class per line. Exit status is 0 when nothing
// needs recompiling, 1 when something does, 2 on error.
//
// Settings come from ~/.weft/config.toml with ./weft.toml on top.

#include <weft/abi/class_reader.hpp>
#include <weft/avoidance.hpp>
#include <weft/config.hpp>
#include <weft/log.hpp>
#include <weft/result.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace weft;

struct Args {
    bool verbose = false;
    fs::path cache_dir;
    std::vector<fs::path> classes;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v") {
            args.verbose = true;
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() < 2) {
        return WeftError{
            WeftError::InvalidArg,
            "expected a cache directory and at least one class file",
            "usage: weft_check [-v] <cache-dir> <class-file>..."
        };
    }
    args.cache_dir = positional[0];
    for (size_t i = 1; i < positional.size(); ++i) {
        args.classes.emplace_back(positional[i]);
    }
    return Result<Args>::ok(std::move(args));
}

Result<std::optional<Config>> load_if_present(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    WEFT_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> load_config() {
    auto global = load_if_present(global_config_path());
    WEFT_TRY(global);
    auto project = load_if_present("weft.toml");
    WEFT_TRY(project);
    return Result<Config>::ok(Config::effective(global.value(), project.value()));
}

Result<std::vector<uint8_t>> read_bytes(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) {
        return WeftError{
            WeftError::IO,
            "could not open class file: " + p.string(),
            "check the path and file permissions"
        };
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    return Result<std::vector<uint8_t>>::ok(std::move(bytes));
}

// The binary name comes from the class file itself. A file that cannot be
// parsed keeps its path as its name so the engine can still report it.
Result<ClassInput> load_class(const fs::path& p) {
    auto bytes = read_bytes(p);
    WEFT_TRY(bytes);

    ClassInput input;
    input.module = p.parent_path().string();
    auto sig = abi::extract_class(bytes.value());
    input.name = sig.is_ok() ? sig.value().name() : p.string();
    input.bytes = std::move(bytes).value();
    return Result<ClassInput>::ok(std::move(input));
}

Result<AvoidanceReport> check(const Args& args, const Config& cfg) {
    auto options = AvoidanceOptions::from_config(cfg);
    WEFT_TRY(options);

    std::vector<ClassInput> classes;
    for (const auto& p : args.classes) {
        auto input = load_class(p);
        WEFT_TRY(input);
        classes.push_back(std::move(input).value());
    }
    log::debug("loaded %zu class files", classes.size());

    CompileAvoidance engine(std::move(options).value());
    PersistentDirectoryCache cache(engine.cache_spec(args.cache_dir, "weft_check", cfg));
    WEFT_TRY(cache.open());

    auto report = engine.run(cache, classes);
    auto closed = cache.close();
    WEFT_TRY(report);
    WEFT_TRY(closed);
    return report;
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }

    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }
    log::set_level(args.value().verbose ? log::Debug : cfg.value().log_level);

    auto report = check(args.value(), cfg.value());
    if (report.is_err()) {
        log::error("compile avoidance check failed");
        std::cerr << report.error().format() << "\n";
        return 2;
    }

    const AvoidanceReport& r = report.value();
    if (r.cache_rebuilt) {
        log::info("no previous fingerprints in %s; everything counts as changed",
                  args.value().cache_dir.c_str());
    }
    for (const auto& name : r.invalidation()) {
        std::cout << name << "\n";
    }
    log::info("%zu changed, %zu removed, %zu unchanged",
              r.changed_api.size(), r.removed_api.size(), r.unchanged.size());
    return r.requires_recompilation() ? 1 : 0;
}
