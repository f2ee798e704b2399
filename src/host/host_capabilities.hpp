#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

// All rows and columns are 0-indexed.
struct Position {
  int row = 0;
  int column = 0;
};

struct Range {
  Position start;
  Position end;
};

struct EditorState {
  std::optional<std::string> path;
  std::string content;
  Position cursor;
  std::string grammar = "Plain Text";
  bool modified = false;
};

struct SelectionInfo {
  std::string text;
  bool is_empty = true;
  Range range;
};

struct OpenEditorInfo {
  std::optional<std::string> path;
  bool modified = false;
  bool active = false;
};

struct TextMatch {
  std::string text;
  Range range;
};

struct FindOptions {
  bool is_regex = false;
  bool case_sensitive = true;
};

struct DockState {
  bool visible = false;
  int items = 0;
};

struct PanelState {
  DockState left;
  DockState right;
  DockState bottom;
  int pane_count = 0;
  int active_pane_index = -1;
};

enum class SplitDirection { kLeft, kRight, kUp, kDown };

std::optional<SplitDirection> ParseSplitDirection(const std::string& s);
const char* SplitDirectionName(SplitDirection d);

nlohmann::json ToJson(const Position& p);
nlohmann::json ToJson(const Range& r);
nlohmann::json ToJson(const EditorState& e);
nlohmann::json ToJson(const SelectionInfo& s);
nlohmann::json ToJson(const OpenEditorInfo& e);
nlohmann::json ToJson(const TextMatch& m);
nlohmann::json ToJson(const PanelState& p);

// The live editor's mutation/query surface. Tool executors reach the editor
// only through this interface.
//
// Methods returning bool report domain outcomes ("no active editor", "file not
// open"). Methods taking `err` fail by returning false/nullopt with `*err` set;
// that is reserved for real failures (I/O errors, invalid regex).
class HostCapabilities {
 public:
  virtual ~HostCapabilities() = default;

  virtual std::optional<EditorState> ActiveEditor() = 0;
  virtual std::optional<std::vector<SelectionInfo>> Selections() = 0;
  virtual std::vector<OpenEditorInfo> OpenEditors() = 0;
  virtual std::vector<std::string> ProjectPaths() = 0;
  virtual PanelState Panels() = 0;

  virtual bool InsertText(const std::string& text) = 0;
  virtual bool SetSelections(const std::vector<Range>& ranges) = 0;
  virtual bool GoToPosition(const Position& pos) = 0;

  virtual bool OpenFile(const std::string& path, std::optional<Position> pos, std::string* err) = 0;
  // Empty path targets the active editor. *saved is false when there is no such editor.
  virtual bool SaveFile(const std::string& path, bool* saved, std::string* err) = 0;
  virtual bool CloseFile(const std::string& path, bool save, bool* closed, std::string* err) = 0;
  virtual bool AddProjectPath(const std::string& path) = 0;
  virtual bool RevealInTreeView(const std::string& path, std::string* err) = 0;

  virtual bool SplitPane(SplitDirection direction, const std::string& path, std::string* err) = 0;
  virtual bool ClosePane(bool save_all, bool* closed, std::string* err) = 0;

  // nullopt with an empty *err means there is no active editor.
  virtual std::optional<std::vector<TextMatch>> FindText(const std::string& pattern,
                                                         const FindOptions& opts,
                                                         std::string* err) = 0;
};

}  // namespace pulsar_mcp
