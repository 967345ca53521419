#include <toolhost/mcp/tool_registry.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/mcp/param_validator.hpp>

namespace toolhost {

// ---------------------------------------------------------------------------
// ToolError
// ---------------------------------------------------------------------------
ToolError ToolError::NotFound(const std::string& tool) {
    return ToolError{ToolErrorKind::ToolNotFound, "Tool not found: " + tool,
                     nlohmann::json{{"tool", tool}}};
}

ToolError ToolError::InvalidParams(const std::string& tool,
                                   const std::string& reason) {
    return ToolError{ToolErrorKind::InvalidParams,
                     "Invalid parameters for " + tool + ": " + reason,
                     nlohmann::json{{"tool", tool}}};
}

ToolError ToolError::Internal(const std::string& verb, const std::string& cause,
                              nlohmann::json detail) {
    return ToolError{ToolErrorKind::Internal,
                     "Failed to " + verb + ": " + cause, std::move(detail)};
}

int ToolError::RpcCode() const noexcept {
    switch (kind) {
        case ToolErrorKind::ToolNotFound:  return -32602;
        case ToolErrorKind::InvalidParams: return -32602;
        case ToolErrorKind::Internal:      return -32603;
    }
    return -32603;
}

const char* ToolError::KindName() const noexcept {
    switch (kind) {
        case ToolErrorKind::ToolNotFound:  return "tool_not_found";
        case ToolErrorKind::InvalidParams: return "invalid_params";
        case ToolErrorKind::Internal:      return "internal_error";
    }
    return "internal_error";
}

nlohmann::json ToolError::ToJson() const {
    nlohmann::json data = nlohmann::json::object();
    if (detail.is_object()) {
        data = detail;
    }
    data["kind"] = KindName();
    return {
        {"code", RpcCode()},
        {"message", message},
        {"data", data}
    };
}

// ---------------------------------------------------------------------------
// ContentItem / ToolResult
// ---------------------------------------------------------------------------
ContentItem ContentItem::Text(std::string text) {
    return ContentItem{Type::Text, std::move(text)};
}

nlohmann::json ContentItem::ToJson() const {
    switch (type) {
        case Type::Text:
            return {{"type", "text"}, {"text", text}};
    }
    return nlohmann::json::object();
}

ToolResult ToolResult::Text(std::string text) {
    ToolResult result;
    result.content.push_back(ContentItem::Text(std::move(text)));
    return result;
}

nlohmann::json ToolResult::ToJson() const {
    auto items = nlohmann::json::array();
    for (const auto& item : content) {
        items.push_back(item.ToJson());
    }
    return {{"content", items}, {"isError", is_error}};
}

// ---------------------------------------------------------------------------
// ToolGroup
// ---------------------------------------------------------------------------
ToolGroup::ToolGroup(std::string name) : name_(std::move(name)) {}

ToolGroup& ToolGroup::Add(std::string name, std::string description,
                          nlohmann::json input_schema, ToolHandler handler) {
    entries_.push_back(Entry{
        ToolDescriptor{std::move(name), std::move(description),
                       std::move(input_schema)},
        std::move(handler)});
    return *this;
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------
bool ToolRegistry::HasTool(const std::string& name) const {
    return slots_.count(name) > 0;
}

ToolOutcome ToolRegistry::Dispatch(const std::string& name,
                                   const nlohmann::json& params) const {
    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return ToolOutcome::Err(ToolError::NotFound(name));
    }

    const auto args = params.is_null() ? nlohmann::json::object() : params;
    const auto& descriptor = descriptors_[it->second.index];
    auto valid = ValidateParams(descriptor.input_schema, args);
    if (valid.IsErr()) {
        return ToolOutcome::Err(ToolError::InvalidParams(name, valid.Error()));
    }

    try {
        return it->second.handler(args);
    } catch (const std::exception& e) {
        LogError("tools", name + " threw: " + e.what());
        return ToolOutcome::Err(ToolError::Internal("execute " + name, e.what()));
    }
}

// ---------------------------------------------------------------------------
// ToolRegistryBuilder
// ---------------------------------------------------------------------------
ToolRegistryBuilder& ToolRegistryBuilder::Add(ToolGroup group) {
    groups_.push_back(std::move(group));
    return *this;
}

Result<ToolRegistry, Error> ToolRegistryBuilder::Build() const {
    ToolRegistry registry;
    std::map<std::string, std::string> owner;  // tool name -> group name

    for (const auto& group : groups_) {
        for (const auto& entry : group.Entries()) {
            const auto& name = entry.descriptor.name;
            auto [pos, inserted] = owner.emplace(name, group.Name());
            if (!inserted) {
                return Result<ToolRegistry, Error>::Err(Error{
                    "BuildToolRegistry", name, std::nullopt,
                    "duplicate tool '" + name + "' registered by groups '" +
                        pos->second + "' and '" + group.Name() + "'",
                    ErrorCategory::Internal});
            }
            registry.slots_.emplace(
                name, ToolRegistry::Slot{registry.descriptors_.size(),
                                         entry.handler});
            registry.descriptors_.push_back(entry.descriptor);
        }
    }

    LogDebug("tools", "registry built with " +
                          std::to_string(registry.descriptors_.size()) +
                          " tools");
    return Result<ToolRegistry, Error>::Ok(std::move(registry));
}

} // namespace toolhost
