#include <toolhost/http/http_client.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/core/url.hpp>
#include <toolhost/core/version.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace toolhost {

namespace {

bool IEquals(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSupportedMethod(const std::string& method) {
    return method == "GET" || method == "HEAD" || method == "POST" ||
           method == "PUT" || method == "PATCH" || method == "DELETE";
}

bool IsSensitiveHeader(const std::string& key) {
    return IEquals(key, "authorization") || IEquals(key, "cookie") ||
           IEquals(key, "proxy-authorization");
}

} // anonymous namespace

const std::string* FindHeader(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (IEquals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpClient::Impl {
    HttpClientOptions options;

    explicit Impl(HttpClientOptions opts) : options(std::move(opts)) {
        if (options.user_agent.empty()) {
            options.user_agent = std::string("toolhost/") + kVersion;
        }
    }

    // With a body, httplib adds Content-Type itself, so a caller-supplied
    // one is left out here and passed as the content type instead.
    httplib::Headers BuildHeaders(const HttpRequest& request, bool sends_body) const {
        httplib::Headers hdrs;
        for (const auto& [key, value] : request.headers) {
            if (sends_body && IEquals(key, "Content-Type")) continue;
            hdrs.emplace(key, value);
        }
        if (FindHeader(request.headers, "User-Agent") == nullptr) {
            hdrs.emplace("User-Agent", options.user_agent);
        }
        return hdrs;
    }

    static void LogRequestHeaders(const httplib::Headers& hdrs) {
        for (const auto& [k, v] : hdrs) {
            LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
        }
    }

    Result<HttpResponse, Error> Send(const HttpRequest& request) const {
        auto parsed = ParseUrl(request.url);
        if (parsed.IsErr()) {
            return Result<HttpResponse, Error>::Err(
                Error{"HttpClient", request.url, std::nullopt,
                      "invalid URL: " + parsed.Error(), ErrorCategory::Internal});
        }
        const auto& url = parsed.Value();

        httplib::Client client(url.Origin());
        client.set_connection_timeout(options.connect_timeout);
        client.set_read_timeout(options.read_timeout);
        client.set_write_timeout(options.read_timeout);
        client.set_follow_location(options.follow_redirects);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client.enable_server_certificate_verification(options.verify_tls);
#endif

        const auto method = ToUpper(request.method);
        const bool sends_body = method != "GET" && method != "HEAD";
        const auto hdrs = BuildHeaders(request, sends_body);
        std::string content_type = request.content_type.empty()
                                       ? std::string("text/plain")
                                       : request.content_type;
        if (const auto* explicit_type = FindHeader(request.headers, "Content-Type")) {
            content_type = *explicit_type;
        }

        LogInfo("http", method + " " + request.url);
        LogRequestHeaders(hdrs);

        if (!IsSupportedMethod(method)) {
            return Result<HttpResponse, Error>::Err(
                Error{"HttpClient", request.url, std::nullopt,
                      "unsupported HTTP method '" + request.method + "'",
                      ErrorCategory::Internal});
        }

        auto res = [&]() -> httplib::Result {
            if (method == "HEAD") {
                return client.Head(url.target, hdrs);
            }
            if (method == "POST") {
                return client.Post(url.target, hdrs, request.body, content_type);
            }
            if (method == "PUT") {
                return client.Put(url.target, hdrs, request.body, content_type);
            }
            if (method == "PATCH") {
                return client.Patch(url.target, hdrs, request.body, content_type);
            }
            if (method == "DELETE") {
                return client.Delete(url.target, hdrs, request.body, content_type);
            }
            return client.Get(url.target, hdrs);
        }();

        if (!res) {
            const auto err = res.error();
            LogWarn("http", method + " " + request.url + " failed: " + httplib::to_string(err));
            return Result<HttpResponse, Error>::Err(
                Error{"HttpClient", request.url, std::nullopt,
                      "HTTP request failed: " + httplib::to_string(err),
                      CategoryFromTransportError(err)});
        }

        LogInfo("http", "  < " + std::to_string(res->status) + " (" +
                            std::to_string(res->body.size()) + " bytes)");
        return Result<HttpResponse, Error>::Ok(
            HttpResponse{res->status, ToHttpHeaders(res->headers), res->body});
    }
};

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------
HttpClient::HttpClient(HttpClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Send(const HttpRequest& request) {
    return impl_->Send(request);
}

const HttpClientOptions& HttpClient::Options() const noexcept {
    return impl_->options;
}

} // namespace toolhost
