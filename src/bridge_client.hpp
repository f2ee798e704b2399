#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace pulsar_mcp {

// Talks to the loopback bridge on behalf of the stdio server.
class BridgeClient {
 public:
  explicit BridgeClient(BridgeEndpoint endpoint);

  void SetTimeouts(int health_seconds, int call_seconds);

  // GET /health; true when the bridge answered 200 with status "ok".
  bool CheckHealth(std::string* err);

  // GET /tools.
  std::optional<nlohmann::json> ListTools(std::string* err);

  // POST /tools/<name>. Returns the envelope's data on success; otherwise
  // nullopt with *err set to the bridge's error or "Tool call failed: <name>".
  std::optional<nlohmann::json> CallTool(const std::string& name, const nlohmann::json& arguments, std::string* err);

  const BridgeEndpoint& endpoint() const { return endpoint_; }
  std::string BaseUrl() const;

 private:
  BridgeEndpoint endpoint_;
  int health_timeout_seconds_ = 2;
  int call_timeout_seconds_ = 300;
};

}  // namespace pulsar_mcp
