#pragma once

#include "host/host_capabilities.hpp"
#include "host/text_buffer.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

// Self-contained editor model: text buffers with multi-cursor selections,
// panes holding editors, three docks and a list of project roots. Files are
// read from and written to disk on open/save.
//
// All state is guarded by one mutex, so concurrent tool calls are serialized
// here rather than in the bridge.
class InMemoryWorkspace : public HostCapabilities {
 public:
  InMemoryWorkspace();

  std::optional<EditorState> ActiveEditor() override;
  std::optional<std::vector<SelectionInfo>> Selections() override;
  std::vector<OpenEditorInfo> OpenEditors() override;
  std::vector<std::string> ProjectPaths() override;
  PanelState Panels() override;

  bool InsertText(const std::string& text) override;
  bool SetSelections(const std::vector<Range>& ranges) override;
  bool GoToPosition(const Position& pos) override;

  bool OpenFile(const std::string& path, std::optional<Position> pos, std::string* err) override;
  bool SaveFile(const std::string& path, bool* saved, std::string* err) override;
  bool CloseFile(const std::string& path, bool save, bool* closed, std::string* err) override;
  bool AddProjectPath(const std::string& path) override;
  bool RevealInTreeView(const std::string& path, std::string* err) override;

  bool SplitPane(SplitDirection direction, const std::string& path, std::string* err) override;
  bool ClosePane(bool save_all, bool* closed, std::string* err) override;

  std::optional<std::vector<TextMatch>> FindText(const std::string& pattern,
                                                 const FindOptions& opts,
                                                 std::string* err) override;

  // Opens an untitled buffer holding `text` in the active pane.
  void OpenUntitled(const std::string& text);

 private:
  struct Document {
    int id = 0;
    std::optional<std::string> path;
    TextBuffer buffer;
    std::vector<Range> selections;
    bool modified = false;
  };

  struct Pane {
    std::vector<int> items;
    int active_item = -1;
  };

  Document* ActiveDocumentLocked();
  Document* FindDocumentLocked(const std::string& resolved_path);
  Pane* PaneOfLocked(int doc_id, size_t* pane_index);
  std::string ResolvePathLocked(const std::string& path) const;
  bool OpenFileLocked(const std::string& path, std::optional<Position> pos, std::string* err);
  bool SaveDocumentLocked(Document* doc, std::string* err);
  void DetachFromPaneLocked(int doc_id);
  void RemoveDocumentLocked(int doc_id);
  Document& AddDocumentLocked(std::optional<std::string> path, std::string text);

  std::mutex mu_;
  int next_doc_id_ = 1;
  std::map<int, Document> documents_;
  std::vector<Pane> panes_;
  size_t active_pane_ = 0;
  DockState left_dock_;
  DockState right_dock_;
  DockState bottom_dock_;
  std::vector<std::string> project_paths_;
};

std::string GrammarForPath(const std::optional<std::string>& path);

}  // namespace pulsar_mcp
