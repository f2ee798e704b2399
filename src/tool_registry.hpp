#pragma once

#include "host/host_capabilities.hpp"
#include "tool_catalog.hpp"
#include "validators.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

struct ExecutionResult {
  bool success = false;
  nlohmann::json data;
  std::string error;

  static ExecutionResult Ok(nlohmann::json data);
  static ExecutionResult Failure(std::string error);
};

// {"success": bool, "data": value|null, "error": string|null}
nlohmann::json ToJson(const ExecutionResult& r);

// Returns the raw result, or nullopt with *err set when the host call failed.
using ToolExecutor =
    std::function<std::optional<nlohmann::json>(HostCapabilities& host, const nlohmann::json& args, std::string* err)>;
using ToolFormatter = std::function<nlohmann::json(const nlohmann::json& raw, const nlohmann::json& args)>;

struct ToolBinding {
  std::vector<FieldRule> rules;
  ToolExecutor execute;
  ToolFormatter format;
  // When set, a raw `false` is reported as a failure with this message.
  std::string false_is_failure;
};

class ToolRegistry {
 public:
  explicit ToolRegistry(HostCapabilities* host) : host_(host) {}

  void Bind(ToolId id, ToolBinding binding);
  bool HasTool(const std::string& name) const;
  std::vector<ToolId> UnboundTools() const;

  // Never throws; every failure is reported in the returned envelope.
  ExecutionResult Execute(const std::string& name, const nlohmann::json& args) const;
  ExecutionResult Execute(ToolId id, const nlohmann::json& args) const;

 private:
  HostCapabilities* host_;
  std::map<ToolId, ToolBinding> bindings_;
};

// Binds every catalog tool to `host`. Throws std::logic_error if a catalog
// entry is left without a binding.
ToolRegistry BuildDefaultToolRegistry(HostCapabilities* host);

}  // namespace pulsar_mcp
