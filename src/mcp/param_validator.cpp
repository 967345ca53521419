#include <toolhost/mcp/param_validator.hpp>

namespace toolhost {

namespace {

using Check = Result<void, std::string>;

bool MatchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    // Unknown type keywords do not constrain the value.
    return true;
}

std::string Describe(const std::string& path) {
    return path.empty() ? "arguments" : "property '" + path + "'";
}

std::string Join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

Check ValidateValue(const nlohmann::json& schema, const nlohmann::json& value,
                    const std::string& path) {
    if (!schema.is_object()) {
        return Check::Ok();
    }

    if (schema.contains("type")) {
        const auto& type = schema["type"];
        if (type.is_string()) {
            const auto expected = type.get<std::string>();
            if (!MatchesType(expected, value)) {
                return Check::Err(Describe(path) + " must be of type " + expected);
            }
        } else if (type.is_array()) {
            bool any = false;
            for (const auto& t : type) {
                if (t.is_string() && MatchesType(t.get<std::string>(), value)) {
                    any = true;
                    break;
                }
            }
            if (!any) {
                return Check::Err(Describe(path) + " must be one of types " +
                                  type.dump());
            }
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& candidate : schema["enum"]) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Check::Err(Describe(path) + " must be one of " +
                              schema["enum"].dump());
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& req : schema["required"]) {
                if (!req.is_string()) continue;
                const auto key = req.get<std::string>();
                if (!value.contains(key)) {
                    return Check::Err("missing required " +
                                      Describe(Join(path, key)));
                }
            }
        }

        const nlohmann::json* properties = nullptr;
        if (schema.contains("properties") && schema["properties"].is_object()) {
            properties = &schema["properties"];
        }
        const nlohmann::json* additional = nullptr;
        if (schema.contains("additionalProperties") &&
            schema["additionalProperties"].is_object()) {
            additional = &schema["additionalProperties"];
        }

        for (auto it = value.begin(); it != value.end(); ++it) {
            const auto child = Join(path, it.key());
            if (properties != nullptr && properties->contains(it.key())) {
                auto r = ValidateValue((*properties)[it.key()], it.value(), child);
                if (r.IsErr()) return r;
            } else if (additional != nullptr) {
                auto r = ValidateValue(*additional, it.value(), child);
                if (r.IsErr()) return r;
            }
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto r = ValidateValue(schema["items"], value[i],
                                   path + "[" + std::to_string(i) + "]");
            if (r.IsErr()) return r;
        }
    }

    return Check::Ok();
}

} // anonymous namespace

Result<void, std::string> ValidateParams(const nlohmann::json& schema,
                                         const nlohmann::json& params) {
    if (!params.is_object()) {
        return Check::Err("arguments must be a JSON object");
    }
    return ValidateValue(schema, params, "");
}

} // namespace toolhost
