#include <toolhost/tools/fetch_tools.hpp>

#include <toolhost/core/encoding.hpp>
#include <toolhost/core/log.hpp>
#include <toolhost/fs/binary_classifier.hpp>

#include "tool_utils.hpp"

#include <string>

namespace toolhost {

using namespace tool_utils;

namespace {

ToolOutcome FetchFailure(const std::string& url, const std::string& cause,
                         nlohmann::json detail = nullptr) {
    if (detail.is_null()) {
        detail = {{"url", url}};
    }
    return ToolOutcome::Err(
        ToolError::Internal("fetch " + url, cause, std::move(detail)));
}

// fetch
ToolOutcome HandleFetch(IHttpClient& http, const nlohmann::json& params) {
    HttpRequest request;
    request.url = params["url"].get<std::string>();
    request.method = OptString(params, "method", "GET");
    request.body = OptString(params, "body");
    request.content_type = OptString(params, "content_type", "text/plain");

    if (params.contains("headers")) {
        const auto& headers = params["headers"];
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            request.headers[it.key()] = it.value().get<std::string>();
        }
    }

    auto response = http.Send(request);
    if (response.IsErr()) {
        const auto& error = response.Error();
        LogWarn("tools", "fetch " + request.url + " failed: " + error.message);
        return FetchFailure(request.url, error.message);
    }

    const auto& resp = response.Value();
    if (resp.status_code < 200 || resp.status_code > 299) {
        return FetchFailure(request.url,
                            "HTTP " + std::to_string(resp.status_code),
                            {{"status", resp.status_code}, {"url", request.url}});
    }

    if (LooksBinary(resp.body)) {
        return TextOutcome(EncodeBinaryPayload(resp.body));
    }
    return TextOutcome(SanitizeUtf8(resp.body));
}

} // anonymous namespace

ToolGroup MakeFetchTools(IHttpClient& http) {
    nlohmann::json string_value = {{"type", "string"}};
    nlohmann::json headers_prop = {
        {"type", "object"},
        {"description", "Extra request headers (name -> value)"},
        {"additionalProperties", string_value}};

    ToolGroup group("fetch");
    group.Add(
        "fetch",
        "Fetch a URL over HTTP(S) and return the response body. Binary bodies "
        "are returned base64-encoded after a marker line.",
        MakeSchema(
            {{"url", StringProp("Absolute http:// or https:// URL")},
             {"method", StringProp("HTTP method: GET (default), POST, PUT, PATCH, DELETE, HEAD")},
             {"headers", headers_prop},
             {"body", StringProp("Request body for POST, PUT and PATCH")},
             {"content_type", StringProp("Content type of the body (default: text/plain)")}},
            {"url"}),
        [&http](const nlohmann::json& params) {
            return HandleFetch(http, params);
        });
    return group;
}

} // namespace toolhost
