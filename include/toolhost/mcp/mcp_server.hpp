#pragma once

#include <toolhost/mcp/tool_service.hpp>

#include <atomic>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace toolhost {

// Protocol revisions this server can speak, oldest first.
inline constexpr const char* kSupportedProtocolVersions[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

struct McpServerOptions {
    // Threads executing tools/call. 0 handles every request inline, in
    // input order.
    std::size_t workers = 0;
};

// ---------------------------------------------------------------------------
// McpServer: MCP server over newline-delimited JSON-RPC 2.0 on a pair of
// streams (stdin/stdout in production).
//
// Implements:
//   - initialize                  (protocol version negotiation)
//   - ping
//   - tools/list
//   - tools/call                  (on the worker pool when workers > 0)
//   - notifications/initialized   (no response)
//   - notifications/cancelled     (drops the response of an in-flight call)
//
// Every response is written whole on its own line under a mutex, in
// completion order. On EOF, calls already queued finish before Run()
// returns.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(const ToolService& service,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout,
                       McpServerOptions options = McpServerOptions());

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    void HandleNotification(const std::string& method,
                            const nlohmann::json& params);

    // In-flight bookkeeping for notifications/cancelled.
    void BeginRequest(const nlohmann::json& id);
    // False if the request was cancelled while running.
    bool FinishRequest(const nlohmann::json& id);

    void Write(const nlohmann::json& message);

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    const nlohmann::json& error);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    const ToolService& service_;
    std::istream& in_;
    std::ostream& out_;
    McpServerOptions options_;
    std::atomic<bool> initialized_{false};

    std::mutex out_mutex_;
    std::mutex requests_mutex_;
    std::set<std::string> in_flight_;   // keyed by id.dump()
    std::set<std::string> cancelled_;
};

} // namespace toolhost
