#include "stdio_server.hpp"

#include "json_rpc.hpp"
#include "log.hpp"
#include "tool_catalog.hpp"

#include <exception>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace pulsar_mcp {
namespace {

static std::string TrimLine(std::string s) {
  while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) start++;
  return s.substr(start);
}

}  // namespace

McpStdioServer::McpStdioServer(StdioConfig cfg) : cfg_(std::move(cfg)), client_(cfg_.bridge) {
  client_.SetTimeouts(cfg_.health_timeout_seconds, cfg_.call_timeout_seconds);
}

std::optional<nlohmann::json> McpStdioServer::HandleLine(const std::string& raw) {
  const auto line = TrimLine(raw);
  if (line.empty()) return std::nullopt;

  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded()) {
    LogDebug("stdio", "parse error line=" + TruncateForLog(line, 200));
    return MakeJsonRpcError(nullptr, kJsonRpcParseError, "Parse error");
  }
  if (!msg.is_object()) return MakeJsonRpcError(nullptr, kJsonRpcInvalidRequest, "Invalid Request");

  const auto method = JsonRpcMethod(msg);
  if (IsJsonRpcNotification(msg)) {
    LogDebug("stdio", "notification method=" + method);
    return std::nullopt;
  }

  const auto id = JsonRpcId(msg);
  LogDebug("stdio", "request id=" + id.dump() + " method=" + method);
  try {
    if (method.empty()) throw JsonRpcError(kJsonRpcInvalidRequest, "Invalid Request");
    return MakeJsonRpcResult(id, Dispatch(method, JsonRpcParams(msg)));
  } catch (const JsonRpcError& e) {
    LogDebug("stdio", "error id=" + id.dump() + " code=" + std::to_string(e.code) + " message=" + e.what());
    return MakeJsonRpcError(id, e.code, e.what());
  } catch (const std::exception& e) {
    LogInfo("stdio", "internal error id=" + id.dump() + " error=" + e.what());
    return MakeJsonRpcError(id, kJsonRpcInternalError, e.what());
  }
}

nlohmann::json McpStdioServer::Dispatch(const std::string& method, const nlohmann::json& params) {
  if (method == "initialize") {
    nlohmann::json out;
    out["protocolVersion"] = kMcpProtocolVersion;
    out["capabilities"] = {{"tools", nlohmann::json::object()}};
    out["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
    return out;
  }
  if (method == "ping") return nlohmann::json::object();
  if (method == "tools/list") return {{"tools", ToolCatalogJson()}};
  if (method == "tools/call") return CallTool(params);
  throw JsonRpcError(kJsonRpcMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpStdioServer::CallTool(const nlohmann::json& params) {
  if (!params.contains("name") || !params["name"].is_string()) {
    throw JsonRpcError(kJsonRpcInvalidParams, "Missing tool name");
  }
  const auto name = params["name"].get<std::string>();

  nlohmann::json args = nlohmann::json::object();
  if (params.contains("arguments") && !params["arguments"].is_null()) {
    if (!params["arguments"].is_object()) throw JsonRpcError(kJsonRpcInvalidParams, "arguments must be an object");
    args = params["arguments"];
  }

  std::string err;
  if (!client_.CheckHealth(&err)) {
    LogDebug("stdio", "bridge unavailable url=" + client_.BaseUrl() + " error=" + err);
    throw JsonRpcError(kJsonRpcInternalError,
                       "Pulsar bridge not available at " + client_.BaseUrl() +
                           ". Make sure Pulsar is running with the MCP bridge enabled.");
  }

  if (!FindTool(name)) throw JsonRpcError(kJsonRpcMethodNotFound, "Unknown tool: " + name);

  err.clear();
  auto data = client_.CallTool(name, args, &err);
  if (!data) throw JsonRpcError(kJsonRpcInternalError, err.empty() ? "Tool call failed: " + name : err);

  nlohmann::json content = nlohmann::json::array();
  content.push_back({{"type", "text"}, {"text", data->dump(2)}});
  return {{"content", content}};
}

int McpStdioServer::Run(std::istream& in, std::ostream& out) {
  LogInfo("stdio", "started bridge=" + client_.BaseUrl());
  std::string line;
  while (std::getline(in, line)) {
    auto resp = HandleLine(line);
    if (!resp) continue;
    out << resp->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    out.flush();
  }
  LogInfo("stdio", "stdin closed");
  return 0;
}

}  // namespace pulsar_mcp
