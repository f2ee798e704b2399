#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

constexpr int kDefaultBridgePort = 3000;
constexpr const char* kDefaultBridgeHost = "127.0.0.1";
constexpr int kDefaultMaxPortProbes = 100;

struct BridgeEndpoint {
  std::string host = kDefaultBridgeHost;
  int port = kDefaultBridgePort;
};

struct BridgeConfig {
  std::string host = kDefaultBridgeHost;
  int base_port = kDefaultBridgePort;
  int max_port_probes = kDefaultMaxPortProbes;
  int keep_alive_seconds = 5;
  int read_timeout_seconds = 60;
  int write_timeout_seconds = 60;
};

struct StdioConfig {
  BridgeEndpoint bridge;
  int health_timeout_seconds = 2;
  int call_timeout_seconds = 300;
};

struct BridgeHostConfig {
  BridgeConfig bridge;
  std::vector<std::string> project_paths;
  std::string stdio_command = "pulsar-mcp-stdio";
};

BridgeConfig LoadBridgeConfigFromEnv();
StdioConfig LoadStdioConfigFromEnv();
BridgeHostConfig LoadBridgeHostConfigFromEnv();

bool IsDebugEnabledFromEnv();

bool IsLoopbackHost(const std::string& host);
std::optional<int> ParsePort(const std::string& s);
std::vector<std::string> SplitCsv(const std::string& s);

// Points child processes spawned from here (the agent and, through it, the stdio
// server) at the bridge address that was actually bound.
void ExportBridgeEnvironment(const BridgeEndpoint& bound);

nlohmann::json BuildMcpServersConfig(const std::string& stdio_command, const BridgeEndpoint& bound);

}  // namespace pulsar_mcp
