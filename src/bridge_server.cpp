#include "bridge_server.hpp"

#include "log.hpp"
#include "tool_catalog.hpp"

#include <nlohmann/json.hpp>

#include <sys/socket.h>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace pulsar_mcp {
namespace {

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
  }
  return true;
}

static nlohmann::json InvalidBodyEnvelope() {
  return {{"success", false}, {"data", nullptr}, {"error", "Invalid JSON body"}};
}

}  // namespace

BridgeServer::BridgeServer(const ToolRegistry* registry, BridgeConfig cfg)
    : registry_(registry), cfg_(std::move(cfg)) {
  bound_.host = cfg_.host;
  bound_.port = cfg_.base_port;
}

BridgeServer::~BridgeServer() {
  Stop();
}

void BridgeServer::Register(httplib::Server* server) {
  server->set_default_headers({{"Access-Control-Allow-Origin", "*"}});

  server->Options(".*", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
  });

  server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["status"] = "ok";
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    SendJson(&res, 200, j);
  });

  server->Get("/tools", [](const httplib::Request&, httplib::Response& res) {
    SendJson(&res, 200, {{"tools", ToolCatalogJson()}});
  });

  server->Post(R"(/tools/([A-Z][a-zA-Z]*))", [this](const httplib::Request& req, httplib::Response& res) {
    const std::string name = req.matches[1].str();
    nlohmann::json args = nlohmann::json::object();
    if (!IsBlank(req.body)) {
      args = nlohmann::json::parse(req.body, nullptr, false);
      if (args.is_discarded() || !args.is_object()) {
        LogDebug("bridge", "POST /tools/" + name + " status=400 error=invalid_json");
        return SendJson(&res, 400, InvalidBodyEnvelope());
      }
    }
    if (!registry_) throw std::runtime_error("no tool registry attached");
    const auto result = registry_->Execute(name, args);
    const int status = result.success ? 200 : 400;
    LogDebug("bridge", "POST /tools/" + name + " status=" + std::to_string(status));
    SendJson(&res, status, ToJson(result));
  });

  server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    LogInfo("bridge", "exception path=" + req.path + " error=" + TruncateForLog(message, 500));
    if (!res.has_header("Access-Control-Allow-Origin")) res.set_header("Access-Control-Allow-Origin", "*");
    SendJson(&res, 500, {{"error", message}});
  });

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    if (res.status == 404) {
      message = "Not found";
    } else if (res.status >= 500) {
      message = "Internal server error";
    } else {
      message = "Bad request";
    }
    res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
  });

  server->set_keep_alive_timeout(cfg_.keep_alive_seconds);
  server->set_read_timeout(cfg_.read_timeout_seconds);
  server->set_write_timeout(cfg_.write_timeout_seconds);
}

bool BridgeServer::Start(std::string* err) {
  std::unique_lock<std::mutex> lock(mu_);
  if (started_) {
    if (err) *err = "bridge: already started";
    return false;
  }
  if (!IsLoopbackHost(cfg_.host)) {
    if (err) *err = "bridge: refusing to listen on non-loopback host " + cfg_.host;
    return false;
  }
  if (cfg_.base_port <= 0 || cfg_.base_port > 65535) {
    if (err) *err = "bridge: invalid base port " + std::to_string(cfg_.base_port);
    return false;
  }

  auto server = std::make_unique<httplib::Server>();
  // SO_REUSEADDR only: with SO_REUSEPORT a port held by another instance would bind again.
  server->set_socket_options([](socket_t sock) {
    int yes = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
  });
  Register(server.get());

  const int probes = cfg_.max_port_probes > 0 ? cfg_.max_port_probes : 1;
  int port = -1;
  int last = cfg_.base_port;
  for (int i = 0; i < probes; i++) {
    const int candidate = cfg_.base_port + i;
    if (candidate > 65535) break;
    last = candidate;
    if (server->bind_to_port(cfg_.host, candidate)) {
      port = candidate;
      break;
    }
    LogDebug("bridge", "port busy host=" + cfg_.host + " port=" + std::to_string(candidate));
  }
  if (port < 0) {
    if (err) {
      *err = "bridge: no free port on " + cfg_.host + " in range " + std::to_string(cfg_.base_port) + "-" +
             std::to_string(last);
    }
    return false;
  }

  bound_.host = cfg_.host;
  bound_.port = port;
  server_ = std::move(server);
  started_ = true;
  running_ = true;
  if (port != cfg_.base_port) {
    LogInfo("bridge", "base port busy base=" + std::to_string(cfg_.base_port) + " using=" + std::to_string(port));
  }
  LogInfo("bridge", "listen host=" + bound_.host + " port=" + std::to_string(bound_.port));

  httplib::Server* srv = server_.get();
  listener_ = std::thread([this, srv]() {
    const bool ok = srv->listen_after_bind();
    LogInfo("bridge", std::string("listen returned ok=") + (ok ? "1" : "0"));
    std::lock_guard<std::mutex> l(mu_);
    running_ = false;
    cv_.notify_all();
  });
  lock.unlock();

  srv->wait_until_ready();
  return true;
}

void BridgeServer::Stop() {
  std::thread listener;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!started_) return;
    if (server_) server_->stop();
    listener = std::move(listener_);
  }
  if (listener.joinable()) {
    listener.join();
    LogInfo("bridge", "stopped port=" + std::to_string(bound_.port));
  }
}

void BridgeServer::Wait() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this]() { return !running_; });
}

bool BridgeServer::IsRunning() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

}  // namespace pulsar_mcp
