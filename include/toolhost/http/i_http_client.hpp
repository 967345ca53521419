#pragma once

#include <toolhost/core/result.hpp>

#include <map>
#include <string>

namespace toolhost {

// Header names are stored as given; lookups that must ignore case go
// through FindHeader().
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;              // absolute http(s) URL
    HttpHeaders headers;
    std::string body;
    std::string content_type;     // used only when body is sent
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpClient: outbound HTTP capability used by the fetch tool.
//
// One instance is shared by every concurrent tool call, so implementations
// keep no per-request state. Transport failures come back as Err; any HTTP
// status, including 4xx/5xx, is an Ok response.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Send(
        const HttpRequest& request) = 0;

protected:
    IHttpClient() = default;
};

/// Case-insensitive header lookup.
[[nodiscard]] const std::string* FindHeader(const HttpHeaders& headers,
                                            const std::string& name);

} // namespace toolhost
