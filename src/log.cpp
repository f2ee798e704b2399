#include "log.hpp"

#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

namespace pulsar_mcp {
namespace {

std::atomic<bool> g_debug{false};
std::mutex g_log_mu;

static void Write(const std::string& tag, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::cerr << "[" << tag << "] " << message << "\n";
}

}  // namespace

void SetDebugLogging(bool enabled) {
  g_debug.store(enabled);
}

bool DebugLoggingEnabled() {
  return g_debug.load();
}

void LogInfo(const std::string& tag, const std::string& message) {
  Write(tag, message);
}

void LogDebug(const std::string& tag, const std::string& message) {
  if (!g_debug.load()) return;
  Write(tag, message);
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

}  // namespace pulsar_mcp
