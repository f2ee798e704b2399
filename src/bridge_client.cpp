#include "bridge_client.hpp"

#include "log.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <utility>

namespace pulsar_mcp {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const BridgeEndpoint& ep, int connect_timeout_seconds,
                                                   int read_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(read_timeout_seconds);
  return cli;
}

static bool EnvelopeSucceeded(const nlohmann::json& body) {
  return body.is_object() && body.contains("success") && body["success"].is_boolean() && body["success"].get<bool>();
}

static std::string ExtractEnvelopeError(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("error") || !body["error"].is_string()) return {};
  return body["error"].get<std::string>();
}

}  // namespace

BridgeClient::BridgeClient(BridgeEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

void BridgeClient::SetTimeouts(int health_seconds, int call_seconds) {
  if (health_seconds > 0) health_timeout_seconds_ = health_seconds;
  if (call_seconds > 0) call_timeout_seconds_ = call_seconds;
}

std::string BridgeClient::BaseUrl() const {
  return "http://" + endpoint_.host + ":" + std::to_string(endpoint_.port);
}

bool BridgeClient::CheckHealth(std::string* err) {
  auto cli = MakeClient(endpoint_, health_timeout_seconds_, health_timeout_seconds_);
  auto res = cli->Get("/health");
  if (!res) {
    if (err) *err = "bridge: failed to connect: " + httplib::to_string(res.error());
    return false;
  }
  if (res->status != 200) {
    if (err) *err = "bridge: http " + std::to_string(res->status);
    return false;
  }
  auto body = nlohmann::json::parse(res->body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("status") || body["status"] != "ok") {
    if (err) *err = "bridge: unexpected health response";
    return false;
  }
  return true;
}

std::optional<nlohmann::json> BridgeClient::ListTools(std::string* err) {
  auto cli = MakeClient(endpoint_, health_timeout_seconds_, call_timeout_seconds_);
  auto res = cli->Get("/tools");
  if (!res) {
    if (err) *err = "bridge: failed to connect: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (res->status != 200) {
    if (err) *err = "bridge: http " + std::to_string(res->status);
    return std::nullopt;
  }
  auto body = nlohmann::json::parse(res->body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("tools") || !body["tools"].is_array()) {
    if (err) *err = "bridge: invalid tools response";
    return std::nullopt;
  }
  return body["tools"];
}

std::optional<nlohmann::json> BridgeClient::CallTool(const std::string& name,
                                                     const nlohmann::json& arguments,
                                                     std::string* err) {
  const std::string fallback = "Tool call failed: " + name;
  auto cli = MakeClient(endpoint_, health_timeout_seconds_, call_timeout_seconds_);
  LogDebug("bridge-call", "tool=" + name + " arguments=" + TruncateForLog(arguments.dump(), 2000));
  auto res = cli->Post("/tools/" + name, arguments.dump(), "application/json");
  if (!res) {
    if (err) *err = fallback;
    LogDebug("bridge-call", "tool=" + name + " transport_error=" + httplib::to_string(res.error()));
    return std::nullopt;
  }

  auto body = nlohmann::json::parse(res->body, nullptr, false);
  const bool ok_status = res->status >= 200 && res->status < 300;
  if (!ok_status || body.is_discarded() || !EnvelopeSucceeded(body)) {
    auto msg = body.is_discarded() ? std::string() : ExtractEnvelopeError(body);
    if (err) *err = msg.empty() ? fallback : msg;
    LogDebug("bridge-call", "tool=" + name + " status=" + std::to_string(res->status) + " error=" + (msg.empty() ? fallback : msg));
    return std::nullopt;
  }
  LogDebug("bridge-call", "tool=" + name + " status=" + std::to_string(res->status) + " ok=1");
  if (!body.contains("data")) return nlohmann::json(nullptr);
  return body["data"];
}

}  // namespace pulsar_mcp
