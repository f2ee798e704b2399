#pragma once

#include "config.hpp"
#include "tool_registry.hpp"

#include <httplib.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pulsar_mcp {

// Loopback HTTP front end for a ToolRegistry. One per editor instance; the
// first free port at or above the configured base port is used.
class BridgeServer {
 public:
  BridgeServer(const ToolRegistry* registry, BridgeConfig cfg);
  ~BridgeServer();

  BridgeServer(const BridgeServer&) = delete;
  BridgeServer& operator=(const BridgeServer&) = delete;

  // Binds and starts the listener thread. Fails for non-loopback hosts and
  // when no port in the probe window can be bound.
  bool Start(std::string* err);

  // Idempotent. Safe before Start and with no client connected.
  void Stop();

  // Blocks until the listener thread has exited.
  void Wait();

  bool IsRunning() const;

  // Valid after a successful Start.
  BridgeEndpoint address() const { return bound_; }

 private:
  void Register(httplib::Server* server);

  const ToolRegistry* registry_;
  BridgeConfig cfg_;
  BridgeEndpoint bound_;
  std::unique_ptr<httplib::Server> server_;
  std::thread listener_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool started_ = false;
  bool running_ = false;
};

}  // namespace pulsar_mcp
