#pragma once

#include <weft/abi/sig.hpp>
#include <weft/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace weft::abi {

constexpr uint32_t ClassMagic = 0xCAFEBABE;
constexpr uint16_t MinMajorVersion = 45;  // JDK 1.1
constexpr uint16_t MaxMajorVersion = 69;  // JDK 25
constexpr uint16_t PreviewMinorVersion = 0xFFFF;

// Parse one compiled class into its signature model. Every member is kept;
// visibility filtering is AbiPolicy's job. Method bodies (Code attributes)
// and debug attributes are skipped without being interpreted.
//
// Any structural problem fails with WeftError::MalformedClassFormat.
Result<ClassSig> extract_class(const uint8_t* data, size_t len);
Result<ClassSig> extract_class(const std::vector<uint8_t>& bytes);

// Reads the file and extracts it; an unreadable file is an IO error.
Result<ClassSig> read_class_file(const std::string& path);

} // namespace weft::abi
