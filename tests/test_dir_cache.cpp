#include <catch2/catch.hpp>
#include <weft/cache/cache_properties.hpp>
#include <weft/cache/dir_cache.hpp>
#include "temp_dir.hpp"

#include <atomic>
#include <fstream>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

using namespace weft;
using weft::test::TempDir;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static CacheSpec make_spec(const fs::path& dir, int* init_calls = nullptr) {
    CacheSpec spec;
    spec.directory = dir;
    spec.identity = "compile:main";
    spec.validator.token = "v1";
    spec.lock.timeout = 2000ms;
    spec.initializer = [init_calls](PersistentDirectoryCache& c) -> Status {
        if (init_calls) ++*init_calls;
        std::ofstream(c.payload_path("init.marker")) << "init";
        return ok_status();
    };
    return spec;
}

static Status write_payload(PersistentDirectoryCache& c, const std::string& name) {
    return c.write([&]() -> Status {
        std::ofstream out(c.payload_path(name));
        out << "payload";
        return ok_status();
    });
}

static bool clean_on_disk(const fs::path& dir) {
    auto p = CacheProperties::load(dir / PersistentDirectoryCache::PropertiesFile);
    REQUIRE(p.is_ok());
    return p.value().clean;
}

// ===== Properties file =====

TEST_CASE("cache properties survive a save and load", "[dir_cache]") {
    TempDir dir("weft_cache");
    CacheProperties p;
    p.schema = "1";
    p.identity = "compile:main";
    p.validator = "v1";
    p.lock_target = "default";
    p.clean = true;
    p.properties["jdk"] = "21";

    REQUIRE(p.save(dir.path / "cache.properties").is_ok());
    REQUIRE_FALSE(fs::exists(dir.path / "cache.properties.tmp"));

    auto loaded = CacheProperties::load(dir.path / "cache.properties");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().identity == "compile:main");
    REQUIRE(loaded.value().clean);
    REQUIRE(loaded.value().properties.at("jdk") == "21");
}

TEST_CASE("cache properties errors", "[dir_cache]") {
    TempDir dir("weft_cache");
    REQUIRE(CacheProperties::load(dir.path / "missing").error().code == WeftError::NotFound);
    REQUIRE(CacheProperties::parse("clean = [").error().code == WeftError::Parse);
    // No flag reads as unclean
    REQUIRE_FALSE(CacheProperties::parse("schema = \"1\"\n").value().clean);
}

// ===== Lifecycle =====

TEST_CASE("first open builds the cache", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    PersistentDirectoryCache cache(make_spec(dir.path / "c", &inits));

    REQUIRE(cache.state() == CacheState::Closed);
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.state() == CacheState::Open);
    REQUIRE(cache.is_open());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(cache.holds_lock());
    REQUIRE(inits == 1);
    REQUIRE(fs::exists(cache.payload_path("init.marker")));
    REQUIRE(cache.lock_path().filename().string() == "cache.properties.lock");
    REQUIRE(clean_on_disk(cache.directory()));

    REQUIRE(cache.close().is_ok());
    REQUIRE(cache.state() == CacheState::Closed);
    REQUIRE_FALSE(cache.holds_lock());
}

TEST_CASE("clean reopen keeps the payload", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    {
        PersistentDirectoryCache cache(make_spec(dir.path, &inits));
        REQUIRE(cache.open().is_ok());
        REQUIRE(write_payload(cache, "data.bin").is_ok());
        REQUIRE(cache.close().is_ok());
    }

    PersistentDirectoryCache again(make_spec(dir.path, &inits));
    REQUIRE(again.open().is_ok());
    REQUIRE_FALSE(again.was_rebuilt());
    REQUIRE(inits == 1);
    REQUIRE(fs::exists(dir.path / "data.bin"));
}

TEST_CASE("eager mode clears the clean flag until close", "[dir_cache]") {
    TempDir dir("weft_cache");
    PersistentDirectoryCache cache(make_spec(dir.path));
    REQUIRE(cache.open().is_ok());
    REQUIRE(clean_on_disk(dir.path));

    REQUIRE(write_payload(cache, "data.bin").is_ok());
    REQUIRE_FALSE(clean_on_disk(dir.path));

    REQUIRE(cache.close().is_ok());
    REQUIRE(clean_on_disk(dir.path));
}

TEST_CASE("unclean marker forces a rebuild", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    {
        PersistentDirectoryCache cache(make_spec(dir.path, &inits));
        REQUIRE(cache.open().is_ok());
        REQUIRE(write_payload(cache, "data.bin").is_ok());
    }

    // Flip the flag back as a writer that died mid-session would leave it
    auto props = CacheProperties::load(dir.path / "cache.properties").value();
    props.clean = false;
    REQUIRE(props.save(dir.path / "cache.properties").is_ok());

    PersistentDirectoryCache cache(make_spec(dir.path, &inits));
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 2);
    REQUIRE_FALSE(fs::exists(dir.path / "data.bin"));
    REQUIRE(fs::exists(dir.path / "init.marker"));
}

TEST_CASE("writer killed mid-session leaves the cache to be rebuilt", "[dir_cache]") {
    TempDir dir("weft_cache");
    {
        PersistentDirectoryCache cache(make_spec(dir.path));
        REQUIRE(cache.open().is_ok());
        REQUIRE(cache.close().is_ok());
    }

    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        PersistentDirectoryCache child(make_spec(dir.path));
        if (child.open().is_err()) _exit(2);
        if (write_payload(child, "half.bin").is_err()) _exit(3);
        _exit(0);  // no close(), no destructor
    }
    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
    REQUIRE(fs::exists(dir.path / "half.bin"));
    REQUIRE_FALSE(clean_on_disk(dir.path));

    int inits = 0;
    PersistentDirectoryCache cache(make_spec(dir.path, &inits));
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 1);
    REQUIRE_FALSE(fs::exists(dir.path / "half.bin"));
}

TEST_CASE("failed write closes unclean", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    {
        PersistentDirectoryCache cache(make_spec(dir.path, &inits));
        REQUIRE(cache.open().is_ok());
        auto r = cache.write([]() -> Status {
            return WeftError(WeftError::IO, "disk full");
        });
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "disk full");
        REQUIRE(cache.close().is_ok());
        REQUIRE(cache.state() == CacheState::ClosedUnclean);
    }

    PersistentDirectoryCache cache(make_spec(dir.path, &inits));
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 2);
}

// ===== Validation =====

TEST_CASE("validator token mismatch forces a rebuild", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    {
        PersistentDirectoryCache cache(make_spec(dir.path, &inits));
        REQUIRE(cache.open().is_ok());
    }

    auto spec = make_spec(dir.path, &inits);
    spec.validator.token = "v2";
    PersistentDirectoryCache cache(spec);
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 2);
    REQUIRE(CacheProperties::load(cache.properties_path()).value().validator == "v2");
}

TEST_CASE("validator callback can reject the contents", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    {
        PersistentDirectoryCache cache(make_spec(dir.path, &inits));
        REQUIRE(cache.open().is_ok());
    }

    auto spec = make_spec(dir.path, &inits);
    spec.validator.is_valid = [&]() { return fs::exists(dir.path / "expected.bin"); };
    PersistentDirectoryCache cache(spec);
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 2);
}

TEST_CASE("identity or property change forces a rebuild", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    auto spec = make_spec(dir.path, &inits);
    spec.properties["abi-policy"] = "compile-avoidance";
    {
        PersistentDirectoryCache cache(spec);
        REQUIRE(cache.open().is_ok());
    }
    {
        PersistentDirectoryCache cache(spec);
        REQUIRE(cache.open().is_ok());
        REQUIRE_FALSE(cache.was_rebuilt());
    }

    spec.properties["abi-policy"] = "public-api";
    {
        PersistentDirectoryCache cache(spec);
        REQUIRE(cache.open().is_ok());
        REQUIRE(cache.was_rebuilt());
    }

    spec.identity = "compile:test";
    PersistentDirectoryCache cache(spec);
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 3);
}

TEST_CASE("initializer failure fails open and is retried next time", "[dir_cache]") {
    TempDir dir("weft_cache");
    auto spec = make_spec(dir.path);
    spec.initializer = [](PersistentDirectoryCache&) -> Status {
        return WeftError(WeftError::IO, "no space");
    };
    {
        PersistentDirectoryCache cache(spec);
        auto r = cache.open();
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "no space");
        REQUIRE_FALSE(cache.is_open());
        REQUIRE(cache.state() == CacheState::ClosedUnclean);
        REQUIRE_FALSE(cache.holds_lock());
    }

    int inits = 0;
    PersistentDirectoryCache cache(make_spec(dir.path, &inits));
    REQUIRE(cache.open().is_ok());
    REQUIRE(inits == 1);
}

// ===== Locking =====

TEST_CASE("second exclusive opener times out", "[dir_cache]") {
    TempDir dir("weft_cache");
    PersistentDirectoryCache first(make_spec(dir.path));
    REQUIRE(first.open().is_ok());

    auto spec = make_spec(dir.path);
    spec.lock.timeout = 50ms;
    PersistentDirectoryCache second(spec);
    auto r = second.open();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::LockTimeout);
    REQUIRE(second.state() == CacheState::Closed);
}

TEST_CASE("exclusive opener waits for the holder to close", "[dir_cache]") {
    TempDir dir("weft_cache");
    PersistentDirectoryCache first(make_spec(dir.path));
    REQUIRE(first.open().is_ok());

    std::thread t([&] {
        std::this_thread::sleep_for(100ms);
        auto closed = first.close();
        (void)closed;
    });

    PersistentDirectoryCache second(make_spec(dir.path));
    auto r = second.open();
    t.join();
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(second.was_rebuilt());
    REQUIRE(first.state() == CacheState::Closed);
}

TEST_CASE("shared openers coexist and may not write", "[dir_cache]") {
    TempDir dir("weft_cache");
    {
        PersistentDirectoryCache init(make_spec(dir.path));
        REQUIRE(init.open().is_ok());
    }

    auto spec = make_spec(dir.path);
    spec.lock.mode = LockMode::Shared;
    PersistentDirectoryCache a(spec);
    PersistentDirectoryCache b(spec);
    REQUIRE(a.open().is_ok());
    REQUIRE(b.open().is_ok());

    bool ran = false;
    REQUIRE(a.read([&]() -> Status { ran = true; return ok_status(); }).is_ok());
    REQUIRE(ran);

    auto w = b.write([]() -> Status { return ok_status(); });
    REQUIRE(w.is_err());
    REQUIRE(w.error().code == WeftError::InvalidArg);
}

TEST_CASE("shared opener rebuilds a stale cache under an exclusive lock", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits = 0;
    auto spec = make_spec(dir.path, &inits);
    spec.lock.mode = LockMode::Shared;

    PersistentDirectoryCache cache(spec);
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.was_rebuilt());
    REQUIRE(inits == 1);
    REQUIRE(clean_on_disk(dir.path));

    // Back to shared: another reader gets in
    PersistentDirectoryCache reader(spec);
    REQUIRE(reader.open().is_ok());
    REQUIRE_FALSE(reader.was_rebuilt());
}

TEST_CASE("concurrent shared openers of a stale cache both get in", "[dir_cache]") {
    TempDir dir("weft_cache");
    int inits_a = 0, inits_b = 0;
    auto spec_a = make_spec(dir.path, &inits_a);
    auto spec_b = make_spec(dir.path, &inits_b);
    spec_a.lock.mode = spec_b.lock.mode = LockMode::Shared;

    std::atomic<bool> go{false};
    std::atomic<int> opened{0};
    auto session = [&](CacheSpec spec, Status& out, bool& rebuilt) {
        while (!go.load()) std::this_thread::yield();
        PersistentDirectoryCache cache(std::move(spec));
        out = cache.open();
        if (out.is_err()) return;
        rebuilt = cache.was_rebuilt();
        // Stay open, shared, until the other opener is in too
        ++opened;
        auto until = std::chrono::steady_clock::now() + 5s;
        while (opened.load() < 2 && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(1ms);
        }
        out = cache.close();
    };

    Status a = ok_status(), b = ok_status();
    bool rebuilt_a = false, rebuilt_b = false;
    std::thread ta(session, spec_a, std::ref(a), std::ref(rebuilt_a));
    std::thread tb(session, spec_b, std::ref(b), std::ref(rebuilt_b));
    go = true;
    ta.join();
    tb.join();

    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(opened.load() == 2);
    REQUIRE(inits_a + inits_b == 1);
    REQUIRE(rebuilt_a != rebuilt_b);
    REQUIRE(clean_on_disk(dir.path));
}

TEST_CASE("on-demand mode locks per operation", "[dir_cache]") {
    TempDir dir("weft_cache");
    auto spec = make_spec(dir.path);
    spec.lock.strategy = LockStrategy::OnDemand;

    PersistentDirectoryCache a(spec);
    PersistentDirectoryCache b(spec);
    REQUIRE(a.open().is_ok());
    REQUIRE_FALSE(a.holds_lock());
    REQUIRE(b.open().is_ok());

    REQUIRE(write_payload(a, "a.bin").is_ok());
    REQUIRE_FALSE(a.holds_lock());
    REQUIRE(clean_on_disk(dir.path));

    bool saw = false;
    REQUIRE(b.read([&]() -> Status {
        saw = fs::exists(dir.path / "a.bin");
        return ok_status();
    }).is_ok());
    REQUIRE(saw);
}

TEST_CASE("cache-dir lock target uses cache.lock", "[dir_cache]") {
    TempDir dir("weft_cache");
    auto spec = make_spec(dir.path);
    spec.target = LockTarget::CacheDirectory;
    PersistentDirectoryCache cache(spec);
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.lock_path().string() == (dir.path / "cache.lock").string());
    REQUIRE(fs::exists(dir.path / "cache.lock"));
    REQUIRE(CacheProperties::load(cache.properties_path()).value().lock_target == "cache-dir");
}

// ===== Misuse and failures =====

TEST_CASE("unwritable cache location is an initialization failure", "[dir_cache]") {
    TempDir dir("weft_cache");
    dir.write_file("blocker", "not a directory");

    PersistentDirectoryCache cache(make_spec(dir.path / "blocker" / "cache"));
    auto r = cache.open();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::CacheInitializationFailure);
    REQUIRE(cache.state() == CacheState::Closed);
}

TEST_CASE("operations require an open cache", "[dir_cache]") {
    TempDir dir("weft_cache");
    PersistentDirectoryCache cache(make_spec(dir.path));
    REQUIRE(cache.read([]() -> Status { return ok_status(); }).error().code
            == WeftError::InvalidArg);
    REQUIRE(write_payload(cache, "x").error().code == WeftError::InvalidArg);

    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.open().error().code == WeftError::InvalidArg);
}

TEST_CASE("close is idempotent and runs the finisher once", "[dir_cache]") {
    TempDir dir("weft_cache");
    int finished = 0;
    auto spec = make_spec(dir.path);
    spec.on_finished = [&](PersistentDirectoryCache& c) -> Status {
        ++finished;
        REQUIRE(c.holds_lock());
        return ok_status();
    };

    PersistentDirectoryCache cache(spec);
    REQUIRE(cache.close().is_ok());
    REQUIRE(finished == 0);

    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.close().is_ok());
    REQUIRE(cache.close().is_ok());
    REQUIRE(finished == 1);

    // Reopening the same object works
    REQUIRE(cache.open().is_ok());
    REQUIRE_FALSE(cache.was_rebuilt());
}
