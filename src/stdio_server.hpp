#pragma once

#include "bridge_client.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace pulsar_mcp {

constexpr const char* kMcpProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "pulsar";
constexpr const char* kServerVersion = "0.1.0";

// Newline-delimited JSON-RPC 2.0 server that forwards tools/call to the bridge.
class McpStdioServer {
 public:
  explicit McpStdioServer(StdioConfig cfg);

  // Handles one input line. nullopt means nothing is written back
  // (notifications and blank lines).
  std::optional<nlohmann::json> HandleLine(const std::string& line);

  // Reads lines until EOF, writing one flushed response line per request.
  int Run(std::istream& in, std::ostream& out);

 private:
  nlohmann::json Dispatch(const std::string& method, const nlohmann::json& params);
  nlohmann::json CallTool(const nlohmann::json& params);

  StdioConfig cfg_;
  BridgeClient client_;
};

}  // namespace pulsar_mcp
