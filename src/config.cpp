#include "config.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

namespace pulsar_mcp {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::optional<int> ParsePositiveInt(const std::string& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') return std::nullopt;
  if (v <= 0 || v > 1000000) return std::nullopt;
  return static_cast<int>(v);
}

}  // namespace

std::optional<int> ParsePort(const std::string& s) {
  auto v = ParsePositiveInt(s);
  if (!v || *v > 65535) return std::nullopt;
  return v;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

bool IsLoopbackHost(const std::string& host) {
  std::string h = ToLower(host);
  if (h == "localhost") return true;
  if (h.size() > 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);

  // Only literal addresses beyond "localhost"; names could resolve anywhere.
  in_addr v4{};
  if (::inet_pton(AF_INET, h.c_str(), &v4) == 1) return (ntohl(v4.s_addr) >> 24) == 127;
  in6_addr v6{};
  if (::inet_pton(AF_INET6, h.c_str(), &v6) == 1) return IN6_IS_ADDR_LOOPBACK(&v6);
  return false;
}

bool IsDebugEnabledFromEnv() {
  bool b = false;
  if (auto v = GetEnvStr("PULSAR_MCP_DEBUG"); !v.empty() && TryParseBool(v, &b)) return b;
  return false;
}

BridgeConfig LoadBridgeConfigFromEnv() {
  BridgeConfig cfg;
  if (auto host = GetEnvStr("PULSAR_BRIDGE_HOST"); !host.empty()) cfg.host = host;
  if (auto port = ParsePort(GetEnvStr("PULSAR_BRIDGE_PORT"))) cfg.base_port = *port;
  if (auto probes = ParsePositiveInt(GetEnvStr("PULSAR_BRIDGE_MAX_PORT_PROBES"))) cfg.max_port_probes = *probes;
  return cfg;
}

StdioConfig LoadStdioConfigFromEnv() {
  StdioConfig cfg;
  if (auto host = GetEnvStr("PULSAR_BRIDGE_HOST"); !host.empty()) cfg.bridge.host = host;
  if (auto port = ParsePort(GetEnvStr("PULSAR_BRIDGE_PORT"))) cfg.bridge.port = *port;
  if (auto t = ParsePositiveInt(GetEnvStr("PULSAR_BRIDGE_TIMEOUT_SECONDS"))) cfg.call_timeout_seconds = *t;
  return cfg;
}

BridgeHostConfig LoadBridgeHostConfigFromEnv() {
  BridgeHostConfig cfg;
  cfg.bridge = LoadBridgeConfigFromEnv();
  if (auto paths = GetEnvStr("PULSAR_PROJECT_PATHS"); !paths.empty()) cfg.project_paths = SplitCsv(paths);
  if (auto cmd = GetEnvStr("PULSAR_MCP_STDIO_COMMAND"); !cmd.empty()) cfg.stdio_command = cmd;
  return cfg;
}

void ExportBridgeEnvironment(const BridgeEndpoint& bound) {
  ::setenv("PULSAR_BRIDGE_HOST", bound.host.c_str(), 1);
  ::setenv("PULSAR_BRIDGE_PORT", std::to_string(bound.port).c_str(), 1);
}

nlohmann::json BuildMcpServersConfig(const std::string& stdio_command, const BridgeEndpoint& bound) {
  nlohmann::json server;
  server["command"] = stdio_command;
  server["args"] = nlohmann::json::array();
  server["env"] = {{"PULSAR_BRIDGE_HOST", bound.host}, {"PULSAR_BRIDGE_PORT", std::to_string(bound.port)}};
  nlohmann::json out;
  out["mcpServers"]["pulsar"] = std::move(server);
  return out;
}

}  // namespace pulsar_mcp
