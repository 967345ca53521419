#pragma once

#include <toolhost/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace toolhost {

// Number of leading bytes inspected when deciding text vs. binary.
constexpr std::size_t kBinarySampleSize = 8192;

// Marker placed before base64 payloads of binary content.
constexpr const char* kBinaryMarker = "[Binary file encoded as base64]\n";

// True if a null byte occurs within the first kBinarySampleSize bytes.
// Formats without a null byte in that window are classified as text.
[[nodiscard]] bool LooksBinary(std::string_view bytes);

// Open the file and classify it from at most kBinarySampleSize bytes.
// Open/read failures come back as Err; the file is never read in full.
Result<bool, Error> IsBinaryFile(const std::string& path);

// kBinaryMarker + base64(bytes)
std::string EncodeBinaryPayload(std::string_view bytes);

} // namespace toolhost
