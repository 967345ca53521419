#pragma once

#include <toolhost/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace toolhost {

// ---------------------------------------------------------------------------
// ParsedUrl: an absolute http(s) URL split the way cpp-httplib wants it:
// an origin for the client and a request target for the call.
// ---------------------------------------------------------------------------
struct ParsedUrl {
    std::string scheme;   // "http" or "https", lower-case
    std::string host;     // IPv6 literals keep their brackets
    uint16_t port = 0;    // explicit or scheme default
    std::string target;   // path + query, never empty ("/" at minimum)

    /// "scheme://host:port"
    [[nodiscard]] std::string Origin() const;
};

// Parse an absolute http:// or https:// URL. The fragment is dropped.
// Userinfo ("user:pass@") is rejected.
Result<ParsedUrl, std::string> ParseUrl(std::string_view url);

} // namespace toolhost
