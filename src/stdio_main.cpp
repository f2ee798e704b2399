#include "config.hpp"
#include "log.hpp"
#include "stdio_server.hpp"

#include <iostream>

int main() {
  std::ios::sync_with_stdio(false);
  pulsar_mcp::SetDebugLogging(pulsar_mcp::IsDebugEnabledFromEnv());

  const auto cfg = pulsar_mcp::LoadStdioConfigFromEnv();
  pulsar_mcp::LogDebug("config", "bridge_host=" + cfg.bridge.host + " bridge_port=" + std::to_string(cfg.bridge.port) +
                                     " call_timeout_seconds=" + std::to_string(cfg.call_timeout_seconds));

  pulsar_mcp::McpStdioServer server(cfg);
  return server.Run(std::cin, std::cout);
}
