#include <catch2/catch.hpp>
#include <weft/result.hpp>
#include <string>

using namespace weft;

static Result<int> try_double(Result<int> input) {
    WEFT_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status try_steps(bool fail_second, int& reached) {
    reached = 1;
    WEFT_TRY(ok_status());
    reached = 2;
    WEFT_TRY(fail_second
        ? Status::err(WeftError{WeftError::LockTimeout, "second failed"})
        : ok_status());
    reached = 3;
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(WeftError{WeftError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("WeftError converts implicitly into any Result", "[result]") {
    Result<std::string> r = WeftError{WeftError::Duplicate, "twice"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::Duplicate);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(WeftError{WeftError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto ok = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(ok.value() == 10);

    bool called = false;
    auto err = Result<int>::err(WeftError{WeftError::Parse, "bad input"})
        .map([&](int x) { called = true; return x; });
    REQUIRE(err.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(err.error().message == "bad input");
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(WeftError{WeftError::HashCollisionDetected, "clash"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == WeftError::HashCollisionDetected);
}

TEST_CASE("WEFT_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(WeftError{WeftError::Parse, "syntax error"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == WeftError::Parse);

    REQUIRE(try_double(Result<int>::ok(21)).value() == 42);
}

TEST_CASE("WEFT_TRY stops at the first failing Status", "[result]") {
    int reached = 0;
    auto r = try_steps(true, reached);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::LockTimeout);
    REQUIRE(reached == 2);

    REQUIRE(try_steps(false, reached).is_ok());
    REQUIRE(reached == 3);
}

TEST_CASE("WeftError::format() includes code, message, hint and location", "[result]") {
    WeftError e{WeftError::MalformedClassFormat, "bad magic", "not a class file",
                "Widget.class", 0};
    auto s = e.format();
    REQUIRE(s.find("error[MalformedClassFormat]: bad magic") != std::string::npos);
    REQUIRE(s.find("hint: not a class file") != std::string::npos);
    REQUIRE(s.find("--> Widget.class") != std::string::npos);
    REQUIRE(s.find("Widget.class:") == std::string::npos);
}

TEST_CASE("code_name() covers the cache and extractor codes", "[result]") {
    REQUIRE(std::string(WeftError::code_name(WeftError::LockTimeout)) == "LockTimeout");
    REQUIRE(std::string(WeftError::code_name(WeftError::StaleOrUncleanCache))
            == "StaleOrUncleanCache");
    REQUIRE(std::string(WeftError::code_name(WeftError::CacheInitializationFailure))
            == "CacheInitializationFailure");
}
