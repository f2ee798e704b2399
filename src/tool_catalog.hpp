#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

enum class ToolId {
  kGetActiveEditor,
  kInsertText,
  kOpenFile,
  kGetProjectPaths,
  kSaveFile,
  kSetSelections,
  kGetSelections,
  kCloseFile,
  kFindText,
  kAddProjectPath,
  kGetOpenEditors,
  kGoToPosition,
  kRevealInTreeView,
  kSplitPane,
  kClosePane,
  kGetPanelState,
};

struct ToolDefinition {
  ToolId id;
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

// Ordered, immutable; the only list behind both tools/list and GET /tools.
const std::vector<ToolDefinition>& ToolCatalog();

const ToolDefinition* FindTool(const std::string& name);
std::optional<ToolId> ToolIdFromName(const std::string& name);
const std::string& ToolName(ToolId id);

nlohmann::json ToolDefinitionToJson(const ToolDefinition& def);
nlohmann::json ToolCatalogJson();

}  // namespace pulsar_mcp
