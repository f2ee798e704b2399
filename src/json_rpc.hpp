#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace pulsar_mcp {

constexpr int kJsonRpcParseError = -32700;
constexpr int kJsonRpcInvalidRequest = -32600;
constexpr int kJsonRpcMethodNotFound = -32601;
constexpr int kJsonRpcInvalidParams = -32602;
constexpr int kJsonRpcInternalError = -32603;

// Raised inside the stdio dispatcher and turned into an error response by the
// outermost handler.
struct JsonRpcError : std::runtime_error {
  JsonRpcError(int code, const std::string& message) : std::runtime_error(message), code(code) {}
  int code;
};

nlohmann::json MakeJsonRpcResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeJsonRpcError(const nlohmann::json& id, int code, const std::string& message);

// Empty when "method" is missing or not a string.
std::string JsonRpcMethod(const nlohmann::json& message);
// null when "id" is missing.
nlohmann::json JsonRpcId(const nlohmann::json& message);
// {} when "params" is missing or not an object.
nlohmann::json JsonRpcParams(const nlohmann::json& message);
bool IsJsonRpcNotification(const nlohmann::json& message);

}  // namespace pulsar_mcp
