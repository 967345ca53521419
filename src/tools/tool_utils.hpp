#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/mcp/tool_registry.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace toolhost::tool_utils {

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

inline nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

inline nlohmann::json MakeSchema(const nlohmann::json& properties,
                                 const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

inline ToolOutcome TextOutcome(std::string text) {
    return ToolOutcome::Ok(ToolResult::Text(std::move(text)));
}

// Filesystem failure: "Failed to <verb>: <os message>".
inline ToolOutcome FsFailure(const std::string& verb, const std::string& path,
                             const Error& error) {
    return ToolOutcome::Err(ToolError::Internal(
        verb, error.message, {{"operation", verb}, {"path", path}}));
}

// Arguments have passed schema validation, so a present key has the
// declared type.
inline std::string OptString(const nlohmann::json& params, const std::string& key,
                             const std::string& default_val = "") {
    if (params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return default_val;
}

} // namespace toolhost::tool_utils
