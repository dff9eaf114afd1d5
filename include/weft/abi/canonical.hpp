#pragma once

#include <weft/abi/sig.hpp>
#include <weft/result.hpp>
#include <weft/sha256.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace weft::abi {

constexpr uint8_t CanonicalFormatVersion = 1;

// Deterministic encoding of a ClassSig: members, interfaces, exceptions,
// class annotations and annotation elements are emitted in sorted order, so
// two semantically equal signatures always produce the same bytes no matter
// in which order the class file listed them.
std::vector<uint8_t> canonical_bytes(const ClassSig& sig);

// ClassSig equality is defined by the canonical form
bool same_abi(const ClassSig& a, const ClassSig& b);

struct Fingerprint {
    std::string class_name;
    Digest digest{};
    // Bytes the digest was computed from; kept so that equal digests over
    // different bytes can be detected. Empty if unknown.
    std::vector<uint8_t> canonical;

    std::string hex() const { return Sha256::to_hex(digest); }

    // Same class, same digest
    bool operator==(const Fingerprint& o) const;
    bool operator!=(const Fingerprint& o) const { return !(*this == o); }
};

Fingerprint fingerprint(const ClassSig& sig);

// Binary class name -> fingerprint, for one compilation unit
using FingerprintMap = std::map<std::string, Fingerprint>;

// HashCollisionDetected if both sides carry canonical bytes, the digests
// match and the bytes do not.
Status check_collision(const Fingerprint& a, const Fingerprint& b);

} // namespace weft::abi
