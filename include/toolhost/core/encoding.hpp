#pragma once

#include <toolhost/core/result.hpp>

#include <string>
#include <string_view>

namespace toolhost {

// Standard base64 (RFC 4648 alphabet) with '=' padding.
std::string Base64Encode(std::string_view bytes);

// Strict decode: rejects characters outside the alphabet, bad padding and
// lengths that are not a multiple of four.
Result<std::string, std::string> Base64Decode(std::string_view text);

// True if the bytes are well-formed UTF-8 (no overlongs, no surrogates,
// nothing above U+10FFFF).
bool IsValidUtf8(std::string_view bytes);

// Replace every byte that does not start a well-formed sequence with U+FFFD.
std::string SanitizeUtf8(std::string_view bytes);

} // namespace toolhost
