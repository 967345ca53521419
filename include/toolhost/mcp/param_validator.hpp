#pragma once

#include <toolhost/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace toolhost {

// Check `params` against the subset of JSON Schema that tool schemas use:
// "type" (string or list), "required", "properties", "additionalProperties"
// (when it is a schema), "items" and "enum". Properties not declared in
// "properties" are accepted. Err carries a one-line reason naming the
// offending property path.
Result<void, std::string> ValidateParams(const nlohmann::json& schema,
                                         const nlohmann::json& params);

} // namespace toolhost
