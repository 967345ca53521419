#include <toolhost/core/url.hpp>

#include <algorithm>
#include <cctype>

namespace toolhost {

namespace {

using UrlResult = Result<ParsedUrl, std::string>;

bool AllDigits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

std::string ParsedUrl::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<ParsedUrl, std::string> ParseUrl(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return UrlResult::Err("relative URL without a base");
    }

    ParsedUrl parsed;
    parsed.scheme = std::string(url.substr(0, scheme_end));
    std::transform(parsed.scheme.begin(), parsed.scheme.end(),
                   parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return UrlResult::Err("unsupported URL scheme '" + parsed.scheme + "'");
    }

    auto rest = url.substr(scheme_end + 3);
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    const auto authority_end = rest.find_first_of("/?");
    const auto authority = rest.substr(0, authority_end);
    if (authority_end == std::string_view::npos) {
        parsed.target = "/";
    } else if (rest[authority_end] == '?') {
        parsed.target = "/" + std::string(rest.substr(authority_end));
    } else {
        parsed.target = std::string(rest.substr(authority_end));
    }

    if (authority.find('@') != std::string_view::npos) {
        return UrlResult::Err("credentials in URL are not supported");
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return UrlResult::Err("invalid IPv6 host");
        }
        host = authority.substr(0, close + 1);
        const auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return UrlResult::Err("invalid port");
            }
            port = tail.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty() || host == "[]") {
        return UrlResult::Err("empty host");
    }
    parsed.host = std::string(host);

    if (port.empty()) {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    } else {
        if (!AllDigits(port) || port.size() > 5) {
            return UrlResult::Err("invalid port");
        }
        const auto value = std::stoul(std::string(port));
        if (value == 0 || value > 65535) {
            return UrlResult::Err("invalid port");
        }
        parsed.port = static_cast<uint16_t>(value);
    }

    return UrlResult::Ok(std::move(parsed));
}

} // namespace toolhost
