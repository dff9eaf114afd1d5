#include <weft/sha256.hpp>
#include <algorithm>
#include <cstring>

namespace weft {

// Round constants, FIPS 180-4 section 4.2.2
static constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static constexpr std::array<uint32_t, 8> H0 = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

static inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

Sha256::Sha256() : h_(H0), length_(0), block_{}, fill_(0) {}

void Sha256::compress(const uint8_t block[64]) {
    uint32_t w[64];
    for (int t = 0; t < 16; ++t) {
        const uint8_t* p = block + t * 4;
        w[t] = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
             | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }
    for (int t = 16; t < 64; ++t) {
        uint32_t s0 = rotr(w[t-15], 7) ^ rotr(w[t-15], 18) ^ (w[t-15] >> 3);
        uint32_t s1 = rotr(w[t-2], 17) ^ rotr(w[t-2], 19) ^ (w[t-2] >> 10);
        w[t] = w[t-16] + s0 + w[t-7] + s1;
    }

    // v[0..7] = a..h
    std::array<uint32_t, 8> v = h_;
    for (int t = 0; t < 64; ++t) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25))
                    + ((e & v[5]) ^ (~e & v[6])) + K[t] + w[t];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22))
                    + ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        for (int i = 7; i > 0; --i) v[i] = v[i-1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) h_[i] += v[i];
}

void Sha256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        size_t take = std::min(len, block_.size() - fill_);
        std::memcpy(block_.data() + fill_, data, take);
        fill_ += take;
        data += take;
        len -= take;
        if (fill_ == block_.size()) {
            compress(block_.data());
            fill_ = 0;
        }
    }
}

void Sha256::update(const std::vector<uint8_t>& bytes) {
    update(bytes.data(), bytes.size());
}

void Sha256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Digest Sha256::finish() {
    uint64_t bits = length_ * 8;

    // 0x80, zero fill to 56 mod 64, then the 64-bit big-endian bit length
    block_[fill_++] = 0x80;
    if (fill_ > 56) {
        std::memset(block_.data() + fill_, 0, 64 - fill_);
        compress(block_.data());
        fill_ = 0;
    }
    std::memset(block_.data() + fill_, 0, 56 - fill_);
    for (int i = 0; i < 8; ++i) {
        block_[56 + i] = uint8_t(bits >> (56 - 8 * i));
    }
    compress(block_.data());
    fill_ = 0;

    Digest out;
    for (int i = 0; i < 8; ++i) {
        out[i*4]     = uint8_t(h_[i] >> 24);
        out[i*4 + 1] = uint8_t(h_[i] >> 16);
        out[i*4 + 2] = uint8_t(h_[i] >> 8);
        out[i*4 + 3] = uint8_t(h_[i]);
    }
    return out;
}

Digest Sha256::of(const uint8_t* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.finish();
}

Digest Sha256::of(const std::vector<uint8_t>& bytes) {
    return of(bytes.data(), bytes.size());
}

std::string Sha256::hex_of(const std::string& s) {
    Sha256 h;
    h.update(s);
    return to_hex(h.finish());
}

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string Sha256::to_hex(const Digest& d) {
    std::string out;
    out.reserve(64);
    for (uint8_t b : d) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

Result<Digest> Sha256::from_hex(const std::string& hex) {
    if (hex.size() != 64) {
        return WeftError(WeftError::Parse,
            "digest must be 64 hex characters, got " + std::to_string(hex.size()));
    }
    Digest d;
    for (size_t i = 0; i < 32; ++i) {
        int hi = hex_val(hex[i*2]);
        int lo = hex_val(hex[i*2 + 1]);
        if (hi < 0 || lo < 0) {
            return WeftError(WeftError::Parse, "invalid hex digit in digest: " + hex);
        }
        d[i] = uint8_t((hi << 4) | lo);
    }
    return Result<Digest>::ok(d);
}

} // namespace weft
