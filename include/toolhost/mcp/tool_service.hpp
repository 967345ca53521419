#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/http/i_http_client.hpp>
#include <toolhost/mcp/tool_registry.hpp>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace toolhost {

struct ServerInfo {
    std::string name;
    std::string version;
    std::string instructions;
    nlohmann::json capabilities;
};

// Merge the echo, fetch and filesystem groups, in that order.
Result<ToolRegistry, Error> BuildDefaultRegistry(IHttpClient& http);

// ---------------------------------------------------------------------------
// ToolService: the single entry point the protocol layer talks to.
//
// Owns the shared HTTP client and the immutable registry built on top of
// it. Safe to call from many threads at once.
// ---------------------------------------------------------------------------
class ToolService {
    // Only Create() can name this, so only Create() can construct.
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static Result<std::unique_ptr<ToolService>, Error> Create(
        std::unique_ptr<IHttpClient> http);

    ToolService(PrivateTag, std::unique_ptr<IHttpClient> http, ToolRegistry registry);

    ToolService(const ToolService&) = delete;
    ToolService& operator=(const ToolService&) = delete;

    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }
    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return registry_.Tools();
    }

    [[nodiscard]] ToolOutcome Call(const std::string& name,
                                   const nlohmann::json& params) const;

private:
    std::unique_ptr<IHttpClient> http_;
    ToolRegistry registry_;
    ServerInfo info_;
};

} // namespace toolhost
