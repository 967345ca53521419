#include <toolhost/mcp/tool_service.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/core/version.hpp>
#include <toolhost/tools/echo_tools.hpp>
#include <toolhost/tools/fetch_tools.hpp>
#include <toolhost/tools/fs_tools.hpp>

namespace toolhost {

namespace {

constexpr const char* kServerName = "toolhost";
constexpr const char* kInstructions =
    "Default local tool server: echo, HTTP fetch and host filesystem access.";

} // anonymous namespace

Result<ToolRegistry, Error> BuildDefaultRegistry(IHttpClient& http) {
    return ToolRegistryBuilder()
        .Add(MakeEchoTools())
        .Add(MakeFetchTools(http))
        .Add(MakeFilesystemTools())
        .Build();
}

Result<std::unique_ptr<ToolService>, Error> ToolService::Create(
    std::unique_ptr<IHttpClient> http) {
    using R = Result<std::unique_ptr<ToolService>, Error>;
    if (!http) {
        return R::Err(Error{"CreateToolService", "", std::nullopt,
                            "no HTTP client given", ErrorCategory::Internal});
    }

    auto registry = BuildDefaultRegistry(*http);
    if (registry.IsErr()) {
        return R::Err(std::move(registry).Error());
    }
    return R::Ok(std::make_unique<ToolService>(
        PrivateTag{}, std::move(http), std::move(registry).Value()));
}

ToolService::ToolService(PrivateTag, std::unique_ptr<IHttpClient> http,
                         ToolRegistry registry)
    : http_(std::move(http)), registry_(std::move(registry)) {
    info_.name = kServerName;
    info_.version = kVersion;
    info_.instructions = kInstructions;
    info_.capabilities = {{"tools", {{"listChanged", true}}}};
}

ToolOutcome ToolService::Call(const std::string& name,
                              const nlohmann::json& params) const {
    LogDebug("tools", "call " + name);
    auto outcome = registry_.Dispatch(name, params);
    if (outcome.IsErr()) {
        LogWarn("tools", name + ": " + outcome.Error().message);
    }
    return outcome;
}

} // namespace toolhost
