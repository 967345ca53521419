#pragma once

#include <toolhost/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolhost {

// ---------------------------------------------------------------------------
// ToolError: the one structured failure a tool call can produce.
// ---------------------------------------------------------------------------
enum class ToolErrorKind {
    ToolNotFound,
    InvalidParams,
    Internal,
};

struct ToolError {
    ToolErrorKind kind = ToolErrorKind::Internal;
    std::string message;
    nlohmann::json detail;  // null or an object merged into the wire "data"

    static ToolError NotFound(const std::string& tool);
    static ToolError InvalidParams(const std::string& tool, const std::string& reason);

    /// "Failed to <verb>: <cause>"
    static ToolError Internal(const std::string& verb, const std::string& cause,
                              nlohmann::json detail = nullptr);

    /// JSON-RPC error code for this kind.
    [[nodiscard]] int RpcCode() const noexcept;

    /// "tool_not_found" | "invalid_params" | "internal_error"
    [[nodiscard]] const char* KindName() const noexcept;

    /// {"code": ..., "message": ..., "data": {"kind": ..., <detail>}}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ContentItem / ToolResult: the success envelope. Only text items are
// produced today; Type leaves room for image/resource items.
// ---------------------------------------------------------------------------
struct ContentItem {
    enum class Type { Text };

    Type type = Type::Text;
    std::string text;

    static ContentItem Text(std::string text);
    [[nodiscard]] nlohmann::json ToJson() const;
};

struct ToolResult {
    std::vector<ContentItem> content;
    bool is_error = false;

    /// Success with exactly one text item.
    static ToolResult Text(std::string text);

    /// {"content": [...], "isError": ...}
    [[nodiscard]] nlohmann::json ToJson() const;
};

using ToolOutcome = Result<ToolResult, ToolError>;

// Handlers receive arguments that already passed schema validation.
using ToolHandler = std::function<ToolOutcome(const nlohmann::json& params)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolGroup: a named, self-contained set of tools (echo, fetch, ...).
// ---------------------------------------------------------------------------
class ToolGroup {
public:
    struct Entry {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    explicit ToolGroup(std::string name);

    ToolGroup& Add(std::string name, std::string description,
                   nlohmann::json input_schema, ToolHandler handler);

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<Entry>& Entries() const noexcept { return entries_; }

private:
    std::string name_;
    std::vector<Entry> entries_;
};

// ---------------------------------------------------------------------------
// ToolRegistry: immutable name -> (descriptor, handler) map.
//
// Dispatch order: unknown name -> ToolNotFound (arguments are not looked
// at); schema violation -> InvalidParams; otherwise the handler runs and
// any exception it throws becomes Internal. Lookups take no lock; the
// registry is never modified after Build().
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] ToolOutcome Dispatch(const std::string& name,
                                       const nlohmann::json& params) const;

private:
    friend class ToolRegistryBuilder;

    struct Slot {
        std::size_t index;      // into descriptors_
        ToolHandler handler;
    };

    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, Slot> slots_;
};

// ---------------------------------------------------------------------------
// ToolRegistryBuilder: merges groups in insertion order. A name that
// appears twice, in one group or across two, fails Build().
// ---------------------------------------------------------------------------
class ToolRegistryBuilder {
public:
    ToolRegistryBuilder& Add(ToolGroup group);

    [[nodiscard]] Result<ToolRegistry, Error> Build() const;

private:
    std::vector<ToolGroup> groups_;
};

} // namespace toolhost
