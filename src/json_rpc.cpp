#include "json_rpc.hpp"

namespace pulsar_mcp {

nlohmann::json MakeJsonRpcResult(const nlohmann::json& id, const nlohmann::json& result) {
  nlohmann::json out;
  out["jsonrpc"] = "2.0";
  out["id"] = id;
  out["result"] = result;
  return out;
}

nlohmann::json MakeJsonRpcError(const nlohmann::json& id, int code, const std::string& message) {
  nlohmann::json out;
  out["jsonrpc"] = "2.0";
  out["id"] = id;
  out["error"] = {{"code", code}, {"message", message}};
  return out;
}

std::string JsonRpcMethod(const nlohmann::json& message) {
  if (message.contains("method") && message["method"].is_string()) return message["method"].get<std::string>();
  return {};
}

nlohmann::json JsonRpcId(const nlohmann::json& message) {
  if (message.contains("id")) return message["id"];
  return nullptr;
}

nlohmann::json JsonRpcParams(const nlohmann::json& message) {
  if (message.contains("params") && message["params"].is_object()) return message["params"];
  return nlohmann::json::object();
}

bool IsJsonRpcNotification(const nlohmann::json& message) {
  return !message.contains("id");
}

}  // namespace pulsar_mcp
