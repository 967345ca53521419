#pragma once

#include <toolhost/http/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace toolhost {

struct HttpClientOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    bool follow_redirects = true;
    bool verify_tls = true;
    std::string user_agent;       // empty: "toolhost/<version>"
};

// ---------------------------------------------------------------------------
// HttpClient: IHttpClient on top of cpp-httplib.
//
// Options are fixed at construction. Each Send() builds its own
// httplib::Client for the target origin, so concurrent calls share nothing
// but the read-only options. Redirects and timeouts are httplib's.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Send(const HttpRequest& request) override;

    [[nodiscard]] const HttpClientOptions& Options() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolhost
