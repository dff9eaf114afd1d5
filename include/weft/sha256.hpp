#pragma once

#include <weft/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace weft {

using Digest = std::array<uint8_t, 32>;

// Streaming SHA-256 (FIPS 180-4). Fingerprints must be identical on every
// platform, so this never delegates to a system crypto library.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& bytes);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finish();

    static Digest of(const uint8_t* data, size_t len);
    static Digest of(const std::vector<uint8_t>& bytes);
    static std::string hex_of(const std::string& s);

    static std::string to_hex(const Digest& d);
    static Result<Digest> from_hex(const std::string& hex);

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> h_;
    uint64_t length_;
    std::array<uint8_t, 64> block_;
    size_t fill_;
};

} // namespace weft
