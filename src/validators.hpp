#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

// Returns nullopt when `value` is acceptable, otherwise a message naming `field`.
using Validator = std::function<std::optional<std::string>(const nlohmann::json& value, const std::string& field)>;

namespace validators {

std::optional<std::string> String(const nlohmann::json& value, const std::string& field);
std::optional<std::string> Number(const nlohmann::json& value, const std::string& field);
std::optional<std::string> Boolean(const nlohmann::json& value, const std::string& field);
std::optional<std::string> Array(const nlohmann::json& value, const std::string& field);
Validator Enum(std::vector<std::string> allowed);

}  // namespace validators

struct FieldRule {
  std::string field;
  Validator validate;
  bool required = true;
};

// Runs rules in order against `args` (an object); first failure wins.
std::optional<std::string> ValidateArgs(const std::vector<FieldRule>& rules, const nlohmann::json& args);

}  // namespace pulsar_mcp
