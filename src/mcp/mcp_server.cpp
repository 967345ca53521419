#include <toolhost/mcp/mcp_server.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/core/worker_pool.hpp>

#include <iterator>
#include <memory>
#include <string>

namespace toolhost {

namespace {

bool IsToolCall(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") &&
           message.contains("method") && message["method"].is_string() &&
           message["method"] == "tools/call" &&
           message.contains("jsonrpc") && message["jsonrpc"] == "2.0";
}

std::string NegotiateVersion(const nlohmann::json& params) {
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        const auto requested = params["protocolVersion"].get<std::string>();
        for (const auto* supported : kSupportedProtocolVersions) {
            if (requested == supported) {
                return requested;
            }
        }
        LogInfo("mcp", "client requested unsupported protocol version " +
                           requested);
    }
    return kSupportedProtocolVersions[std::size(kSupportedProtocolVersions) - 1];
}

} // anonymous namespace

McpServer::McpServer(const ToolService& service,
                     std::istream& in,
                     std::ostream& out,
                     McpServerOptions options)
    : service_(service), in_(in), out_(out), options_(options) {}

void McpServer::Run() {
    std::unique_ptr<WorkerPool> pool;
    if (options_.workers > 0) {
        pool = std::make_unique<WorkerPool>(options_.workers);
    }
    LogInfo("mcp", "serving on stdio with " + std::to_string(options_.workers) +
                       " worker(s)");

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn("mcp", std::string("parse error: ") + e.what());
            Write(MakeError(nullptr, -32700, "Parse error"));
            continue;
        }

        if (pool && IsToolCall(message)) {
            const auto id = message["id"];
            BeginRequest(id);
            const bool queued = pool->Submit([this, message, id] {
                auto response = HandleMessage(message);
                if (FinishRequest(id) && response) {
                    Write(*response);
                }
            });
            if (queued) continue;
            FinishRequest(id);
        }

        auto response = HandleMessage(message);
        if (response) {
            Write(*response);
        }
    }

    if (pool) {
        LogDebug("mcp", "input closed, draining in-flight calls");
        pool->Shutdown();
    }
    LogInfo("mcp", "input closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    const bool is_notification = !message.contains("id");
    if (!message.contains("method") || !message["method"].is_string()) {
        if (is_notification) return std::nullopt;
        return MakeError(message["id"], -32600, "Invalid Request");
    }

    const auto method = message["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (message.contains("params") && !message["params"].is_null()) {
        params = message["params"];
    }

    if (is_notification) {
        HandleNotification(method, params);
        return std::nullopt;
    }

    const auto& id = message["id"];
    LogDebug("mcp", "request " + method + " id=" + id.dump());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else {
        return MakeError(id, -32601, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    const auto& info = service_.Info();
    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        LogInfo("mcp", "initialize from " + params["clientInfo"].dump());
    }

    nlohmann::json result;
    result["protocolVersion"] = NegotiateVersion(params);
    result["capabilities"] = info.capabilities;
    result["serverInfo"] = {
        {"name", info.name},
        {"version", info.version}
    };
    result["instructions"] = info.instructions;

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& tool : service_.Tools()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    const auto tool_name = params["name"].get<std::string>();
    nlohmann::json arguments;
    if (params.contains("arguments")) {
        arguments = params["arguments"];
    }

    auto outcome = service_.Call(tool_name, arguments);
    if (outcome.IsErr()) {
        return MakeError(id, outcome.Error().ToJson());
    }
    return MakeResult(id, outcome.Value().ToJson());
}

void McpServer::HandleNotification(const std::string& method,
                                   const nlohmann::json& params) {
    if (method == "notifications/cancelled") {
        if (!params.is_object() || !params.contains("requestId")) return;
        const auto key = params["requestId"].dump();
        std::lock_guard<std::mutex> lock(requests_mutex_);
        if (in_flight_.count(key) > 0) {
            cancelled_.insert(key);
            LogInfo("mcp", "request " + key + " cancelled");
        }
        return;
    }
    LogDebug("mcp", "notification " + method);
}

void McpServer::BeginRequest(const nlohmann::json& id) {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    in_flight_.insert(id.dump());
}

bool McpServer::FinishRequest(const nlohmann::json& id) {
    const auto key = id.dump();
    std::lock_guard<std::mutex> lock(requests_mutex_);
    in_flight_.erase(key);
    return cancelled_.erase(key) == 0;
}

void McpServer::Write(const nlohmann::json& message) {
    // Invalid UTF-8 in tool output must not abort the write.
    const auto line = message.dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line << "\n";
    out_.flush();
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return MakeError(id, {{"code", code}, {"message", message}});
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, const nlohmann::json& error) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace toolhost
