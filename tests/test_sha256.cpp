#include <catch2/catch.hpp>
#include <weft/sha256.hpp>
#include <string>
#include <vector>

using namespace weft;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(Sha256::hex_of("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 'abc' (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::hex_of("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 448-bit message (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::hex_of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256 896-bit message (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::hex_of(
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmno"
        "ijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu") ==
            "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST_CASE("SHA256 one million 'a' (NIST vector)", "[sha256]") {
    Sha256 ctx;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) ctx.update(chunk);
    REQUIRE(Sha256::to_hex(ctx.finish()) ==
            "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("SHA256 incremental update matches one-shot", "[sha256]") {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    Sha256 ctx;
    for (char c : msg) ctx.update(std::string(1, c));
    std::vector<uint8_t> bytes(msg.begin(), msg.end());
    REQUIRE(ctx.finish() == Sha256::of(bytes));
}

TEST_CASE("SHA256 messages around the padding boundary", "[sha256]") {
    // 55 bytes fit one block with the length; 56 need a second block
    REQUIRE(Sha256::hex_of(std::string(55, 'a')) ==
            "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e910f734318");
    REQUIRE(Sha256::hex_of(std::string(56, 'a')) ==
            "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef7970686ec6738a");
    REQUIRE(Sha256::hex_of(std::string(64, 'a')) ==
            "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
}

TEST_CASE("from_hex parses to_hex output", "[sha256]") {
    auto d = Sha256::of(std::vector<uint8_t>{1, 2, 3});
    auto parsed = Sha256::from_hex(Sha256::to_hex(d));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == d);
}

TEST_CASE("from_hex rejects bad input", "[sha256]") {
    REQUIRE(Sha256::from_hex("abc").error().code == WeftError::Parse);
    REQUIRE(Sha256::from_hex(std::string(64, 'g')).error().code == WeftError::Parse);
}
