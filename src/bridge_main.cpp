#include "bridge_server.hpp"
#include "config.hpp"
#include "host/in_memory_workspace.hpp"
#include "log.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

static void HandleSignal(int) {
  g_stop_requested = 1;
}

}  // namespace

int main() {
  pulsar_mcp::SetDebugLogging(pulsar_mcp::IsDebugEnabledFromEnv());
  const auto cfg = pulsar_mcp::LoadBridgeHostConfigFromEnv();

  pulsar_mcp::InMemoryWorkspace workspace;
  for (const auto& path : cfg.project_paths) {
    if (!workspace.AddProjectPath(path)) pulsar_mcp::LogInfo("workspace", "skip project path=" + path);
  }

  std::optional<pulsar_mcp::ToolRegistry> registry;
  try {
    registry.emplace(pulsar_mcp::BuildDefaultToolRegistry(&workspace));
  } catch (const std::exception& e) {
    pulsar_mcp::LogInfo("registry", std::string("error=") + e.what());
    return 1;
  }

  pulsar_mcp::BridgeServer bridge(&*registry, cfg.bridge);
  std::string err;
  if (!bridge.Start(&err)) {
    pulsar_mcp::LogInfo("bridge", "start failed error=" + err);
    return 1;
  }

  const auto bound = bridge.address();
  pulsar_mcp::ExportBridgeEnvironment(bound);
  std::cout << pulsar_mcp::BuildMcpServersConfig(cfg.stdio_command, bound).dump(2) << std::endl;

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  while (!g_stop_requested && bridge.IsRunning()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  bridge.Stop();
  bridge.Wait();
  return 0;
}
