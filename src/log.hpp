#pragma once

#include <cstddef>
#include <string>

namespace pulsar_mcp {

// Log records go to stderr: stdout belongs to the JSON-RPC stream in the stdio process.
void SetDebugLogging(bool enabled);
bool DebugLoggingEnabled();

void LogInfo(const std::string& tag, const std::string& message);
void LogDebug(const std::string& tag, const std::string& message);

std::string TruncateForLog(std::string s, size_t max_chars);

}  // namespace pulsar_mcp
