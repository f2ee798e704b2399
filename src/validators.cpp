#include "validators.hpp"

#include <algorithm>
#include <utility>

namespace pulsar_mcp {
namespace validators {

std::optional<std::string> String(const nlohmann::json& value, const std::string& field) {
  if (value.is_null()) return field + " is required";
  if (!value.is_string()) return field + " must be a string";
  return std::nullopt;
}

std::optional<std::string> Number(const nlohmann::json& value, const std::string& field) {
  if (value.is_null()) return field + " is required";
  if (!value.is_number()) return field + " must be a number";
  return std::nullopt;
}

std::optional<std::string> Boolean(const nlohmann::json& value, const std::string& field) {
  if (value.is_null()) return field + " is required";
  if (!value.is_boolean()) return field + " must be a boolean";
  return std::nullopt;
}

std::optional<std::string> Array(const nlohmann::json& value, const std::string& field) {
  if (value.is_null()) return field + " is required";
  if (!value.is_array()) return field + " must be an array";
  return std::nullopt;
}

Validator Enum(std::vector<std::string> allowed) {
  return [allowed = std::move(allowed)](const nlohmann::json& value,
                                        const std::string& field) -> std::optional<std::string> {
    if (value.is_string() &&
        std::find(allowed.begin(), allowed.end(), value.get<std::string>()) != allowed.end()) {
      return std::nullopt;
    }
    std::string msg = field + " must be one of: ";
    for (size_t i = 0; i < allowed.size(); i++) {
      if (i > 0) msg += ", ";
      msg += allowed[i];
    }
    return msg;
  };
}

}  // namespace validators

std::optional<std::string> ValidateArgs(const std::vector<FieldRule>& rules, const nlohmann::json& args) {
  for (const auto& rule : rules) {
    const bool present = args.is_object() && args.contains(rule.field) && !args[rule.field].is_null();
    if (!present) {
      if (rule.required) return rule.field + " is required";
      continue;
    }
    if (auto msg = rule.validate(args[rule.field], rule.field)) return msg;
  }
  return std::nullopt;
}

}  // namespace pulsar_mcp
