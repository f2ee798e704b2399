#include "tool_catalog.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace pulsar_mcp {
namespace {

static nlohmann::json ObjectSchema(nlohmann::json properties, std::vector<std::string> required) {
  return {{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

static nlohmann::json NoArgs() {
  return ObjectSchema(nlohmann::json::object(), {});
}

static nlohmann::json Prop(const char* type, const char* description) {
  return {{"type", type}, {"description", description}};
}

static std::vector<ToolDefinition> BuildCatalog() {
  std::vector<ToolDefinition> out;

  out.push_back({ToolId::kGetActiveEditor, "GetActiveEditor",
                 "Get the active editor state. Returns {path: string|null, content: string, cursorPosition: {row, "
                 "column} (0-indexed), grammar: string, modified: boolean}, or null if no editor is open.",
                 NoArgs()});

  out.push_back({ToolId::kInsertText, "InsertText",
                 "Insert text at cursor or replace selection. If text is selected, replaces it; otherwise inserts at "
                 "cursor. Works with multi-cursor. Fails if no editor is open.",
                 ObjectSchema({{"text", Prop("string", "The text to insert (replaces selection if any)")}}, {"text"})});

  out.push_back({ToolId::kOpenFile, "OpenFile",
                 "Open a file in editor. All positions are 0-indexed. Returns true on success. Creates new file if "
                 "path doesn't exist.",
                 ObjectSchema({{"path", Prop("string", "File path (absolute or relative to project root)")},
                               {"row", Prop("number", "Row to navigate to (0-indexed, optional)")},
                               {"column", Prop("number", "Column to navigate to (0-indexed, optional)")}},
                              {"path"})});

  out.push_back({ToolId::kGetProjectPaths, "GetProjectPaths",
                 "Get project root folders. Returns string[] of absolute paths. Empty array if no project open.",
                 NoArgs()});

  out.push_back({ToolId::kSaveFile, "SaveFile",
                 "Save a file. Fails if file not found or no editor. If path omitted, saves active editor.",
                 ObjectSchema({{"path", Prop("string", "File path to save (optional, defaults to active editor)")}}, {})});

  {
    nlohmann::json range_item = ObjectSchema({{"startRow", Prop("number", "Start line (0-indexed)")},
                                              {"startColumn", Prop("number", "Start column (0-indexed)")},
                                              {"endRow", Prop("number", "End line (0-indexed)")},
                                              {"endColumn", Prop("number", "End column (0-indexed)")}},
                                             {"startRow", "startColumn", "endRow", "endColumn"});
    nlohmann::json ranges = Prop("array", "Array of selection ranges");
    ranges["items"] = std::move(range_item);
    out.push_back({ToolId::kSetSelections, "SetSelections",
                   "Set multi-cursor selections. All positions are 0-indexed. Example: [{startRow:0, startColumn:0, "
                   "endRow:0, endColumn:5}] selects first 5 chars of line 1. Returns false if no editor.",
                   ObjectSchema({{"ranges", std::move(ranges)}}, {"ranges"})});
  }

  out.push_back({ToolId::kGetSelections, "GetSelections",
                 "Get all selections/cursors. Returns array of {text: string, isEmpty: boolean, range: {start: {row, "
                 "column}, end: {row, column}}} (0-indexed). First element is primary selection. Returns null if no "
                 "editor.",
                 NoArgs()});

  out.push_back({ToolId::kCloseFile, "CloseFile",
                 "Close an editor tab. Fails if file not found. If path omitted, closes active editor. Unsaved changes "
                 "are discarded unless save=true.",
                 ObjectSchema({{"path", Prop("string", "File path to close (optional, defaults to active editor)")},
                               {"save", Prop("boolean", "Save before closing if modified (default: false)")}},
                              {})});

  out.push_back({ToolId::kFindText, "FindText",
                 "Find all matches in active editor. Returns {matches: [{text, range: {start: {row, column}, end: "
                 "{row, column}}}], count}. All positions 0-indexed. Uses ECMAScript regex syntax. Returns null if no "
                 "editor.",
                 ObjectSchema({{"pattern", Prop("string", "Search text or ECMAScript regex pattern")},
                               {"isRegex", Prop("boolean", "Treat pattern as regex (default: false)")},
                               {"caseSensitive", Prop("boolean", "Case sensitive search (default: true)")}},
                              {"pattern"})});

  out.push_back({ToolId::kAddProjectPath, "AddProjectPath",
                 "Add a folder to project roots without removing existing paths. Fails if path is not an existing "
                 "folder.",
                 ObjectSchema({{"path", Prop("string", "Absolute folder path to add")}}, {"path"})});

  out.push_back({ToolId::kGetOpenEditors, "GetOpenEditors",
                 "List open editors. Returns array of {path: string|null, modified: boolean, active: boolean}.",
                 NoArgs()});

  out.push_back({ToolId::kGoToPosition, "GoToPosition",
                 "Move the cursor of the active editor. All positions are 0-indexed. Returns false if no editor.",
                 ObjectSchema({{"row", Prop("number", "Row to navigate to (0-indexed)")},
                               {"column", Prop("number", "Column to navigate to (0-indexed, default: 0)")}},
                              {"row"})});

  out.push_back({ToolId::kRevealInTreeView, "RevealInTreeView",
                 "Open a file and reveal it in the project tree view. Returns true on success.",
                 ObjectSchema({{"path", Prop("string", "File path to reveal")}}, {"path"})});

  {
    nlohmann::json direction = Prop("string", "Direction to split the active pane");
    direction["enum"] = {"left", "right", "up", "down"};
    out.push_back({ToolId::kSplitPane, "SplitPane",
                   "Split the active pane. Optionally open a file in the new pane. Returns true on success.",
                   ObjectSchema({{"direction", std::move(direction)},
                                 {"path", Prop("string", "File to open in the new pane (optional)")}},
                                {"direction"})});
  }

  out.push_back({ToolId::kClosePane, "ClosePane",
                 "Close the active pane and its items. Unsaved changes are discarded unless saveAll=true.",
                 ObjectSchema({{"saveAll", Prop("boolean", "Save modified items before closing (default: false)")}},
                              {})});

  out.push_back({ToolId::kGetPanelState, "GetPanelState",
                 "Get dock and pane layout. Returns {left, right, bottom: {visible, items}, panes: {count, "
                 "activeIndex}}.",
                 NoArgs()});

  return out;
}

}  // namespace

const std::vector<ToolDefinition>& ToolCatalog() {
  static const std::vector<ToolDefinition> catalog = BuildCatalog();
  return catalog;
}

const ToolDefinition* FindTool(const std::string& name) {
  for (const auto& def : ToolCatalog()) {
    if (def.name == name) return &def;
  }
  return nullptr;
}

std::optional<ToolId> ToolIdFromName(const std::string& name) {
  const auto* def = FindTool(name);
  if (!def) return std::nullopt;
  return def->id;
}

const std::string& ToolName(ToolId id) {
  for (const auto& def : ToolCatalog()) {
    if (def.id == id) return def.name;
  }
  throw std::logic_error("tool id missing from catalog");
}

nlohmann::json ToolDefinitionToJson(const ToolDefinition& def) {
  nlohmann::json j;
  j["name"] = def.name;
  j["description"] = def.description;
  j["inputSchema"] = def.input_schema;
  return j;
}

nlohmann::json ToolCatalogJson() {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& def : ToolCatalog()) tools.push_back(ToolDefinitionToJson(def));
  return tools;
}

}  // namespace pulsar_mcp
