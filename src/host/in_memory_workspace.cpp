#include "host/in_memory_workspace.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace pulsar_mcp {
namespace {

namespace fs = std::filesystem;

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

}  // namespace

std::string GrammarForPath(const std::optional<std::string>& path) {
  if (!path) return "Plain Text";
  const auto ext = ToLower(fs::path(*path).extension().string());
  if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" || ext == ".h") return "C++";
  if (ext == ".c") return "C";
  if (ext == ".js" || ext == ".mjs" || ext == ".cjs") return "JavaScript";
  if (ext == ".ts") return "TypeScript";
  if (ext == ".py") return "Python";
  if (ext == ".json") return "JSON";
  if (ext == ".md") return "GitHub Markdown";
  if (ext == ".cmake" || fs::path(*path).filename() == "CMakeLists.txt") return "CMake";
  if (ext == ".sh") return "Shell Script";
  return "Plain Text";
}

InMemoryWorkspace::InMemoryWorkspace() {
  panes_.push_back(Pane{});
  left_dock_ = DockState{true, 1};
}

InMemoryWorkspace::Document* InMemoryWorkspace::ActiveDocumentLocked() {
  if (active_pane_ >= panes_.size()) return nullptr;
  auto it = documents_.find(panes_[active_pane_].active_item);
  if (it == documents_.end()) return nullptr;
  return &it->second;
}

InMemoryWorkspace::Document* InMemoryWorkspace::FindDocumentLocked(const std::string& resolved_path) {
  for (auto& [_, doc] : documents_) {
    if (doc.path && *doc.path == resolved_path) return &doc;
  }
  return nullptr;
}

InMemoryWorkspace::Pane* InMemoryWorkspace::PaneOfLocked(int doc_id, size_t* pane_index) {
  for (size_t i = 0; i < panes_.size(); i++) {
    const auto& items = panes_[i].items;
    if (std::find(items.begin(), items.end(), doc_id) != items.end()) {
      if (pane_index) *pane_index = i;
      return &panes_[i];
    }
  }
  return nullptr;
}

std::string InMemoryWorkspace::ResolvePathLocked(const std::string& path) const {
  fs::path p(path);
  if (p.is_relative()) {
    if (!project_paths_.empty()) {
      p = fs::path(project_paths_.front()) / p;
    } else {
      std::error_code ec;
      auto abs = fs::absolute(p, ec);
      if (!ec) p = abs;
    }
  }
  return p.lexically_normal().generic_string();
}

InMemoryWorkspace::Document& InMemoryWorkspace::AddDocumentLocked(std::optional<std::string> path, std::string text) {
  Document doc;
  doc.id = next_doc_id_++;
  doc.path = std::move(path);
  doc.buffer.SetText(std::move(text));
  doc.selections.push_back(Range{});
  const int id = doc.id;
  auto& stored = documents_[id] = std::move(doc);

  auto& pane = panes_[active_pane_];
  pane.items.push_back(id);
  pane.active_item = id;
  return stored;
}

void InMemoryWorkspace::DetachFromPaneLocked(int doc_id) {
  size_t pane_index = 0;
  if (auto* pane = PaneOfLocked(doc_id, &pane_index)) {
    auto& items = pane->items;
    auto it = std::find(items.begin(), items.end(), doc_id);
    const auto pos = static_cast<size_t>(std::distance(items.begin(), it));
    items.erase(it);
    if (pane->active_item == doc_id) {
      if (items.empty()) {
        pane->active_item = -1;
      } else {
        pane->active_item = items[std::min(pos, items.size() - 1)];
      }
    }
  }
}

void InMemoryWorkspace::RemoveDocumentLocked(int doc_id) {
  DetachFromPaneLocked(doc_id);
  documents_.erase(doc_id);
}

bool InMemoryWorkspace::OpenFileLocked(const std::string& path, std::optional<Position> pos, std::string* err) {
  if (path.empty()) {
    if (err) *err = "path must not be empty";
    return false;
  }
  const auto resolved = ResolvePathLocked(path);

  Document* doc = FindDocumentLocked(resolved);
  if (doc) {
    size_t pane_index = 0;
    if (auto* pane = PaneOfLocked(doc->id, &pane_index)) {
      active_pane_ = pane_index;
      pane->active_item = doc->id;
    }
  } else {
    std::string text;
    std::error_code ec;
    if (fs::exists(resolved, ec)) {
      if (fs::is_directory(resolved, ec)) {
        if (err) *err = "Cannot open a directory: " + resolved;
        return false;
      }
      std::ifstream in(resolved, std::ios::binary);
      if (!in) {
        if (err) *err = "Failed to read " + resolved;
        return false;
      }
      std::ostringstream oss;
      oss << in.rdbuf();
      text = oss.str();
    }
    doc = &AddDocumentLocked(resolved, std::move(text));
  }

  if (pos) {
    const auto p = doc->buffer.Clip(*pos);
    doc->selections = {Range{p, p}};
  }
  return true;
}

bool InMemoryWorkspace::SaveDocumentLocked(Document* doc, std::string* err) {
  if (!doc->path) {
    if (err) *err = "Cannot save an untitled editor";
    return false;
  }
  const fs::path target(*doc->path);
  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
  if (ec) {
    if (err) *err = "Failed to create directory for " + *doc->path + ": " + ec.message();
    return false;
  }
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  out << doc->buffer.Text();
  out.flush();
  if (!out) {
    if (err) *err = "Failed to write " + *doc->path;
    return false;
  }
  doc->modified = false;
  return true;
}

std::optional<EditorState> InMemoryWorkspace::ActiveEditor() {
  std::lock_guard<std::mutex> lock(mu_);
  auto* doc = ActiveDocumentLocked();
  if (!doc) return std::nullopt;
  EditorState state;
  state.path = doc->path;
  state.content = doc->buffer.Text();
  if (!doc->selections.empty()) state.cursor = doc->buffer.Clip(doc->selections.front().end);
  state.grammar = GrammarForPath(doc->path);
  state.modified = doc->modified;
  return state;
}

std::optional<std::vector<SelectionInfo>> InMemoryWorkspace::Selections() {
  std::lock_guard<std::mutex> lock(mu_);
  auto* doc = ActiveDocumentLocked();
  if (!doc) return std::nullopt;
  std::vector<SelectionInfo> out;
  for (const auto& sel : doc->selections) {
    SelectionInfo info;
    info.range = doc->buffer.Clip(sel);
    info.text = doc->buffer.TextIn(info.range);
    info.is_empty = info.range.start.row == info.range.end.row && info.range.start.column == info.range.end.column;
    out.push_back(std::move(info));
  }
  return out;
}

std::vector<OpenEditorInfo> InMemoryWorkspace::OpenEditors() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto* active = ActiveDocumentLocked();
  std::vector<OpenEditorInfo> out;
  for (const auto& pane : panes_) {
    for (int id : pane.items) {
      auto it = documents_.find(id);
      if (it == documents_.end()) continue;
      OpenEditorInfo info;
      info.path = it->second.path;
      info.modified = it->second.modified;
      info.active = active == &it->second;
      out.push_back(std::move(info));
    }
  }
  return out;
}

std::vector<std::string> InMemoryWorkspace::ProjectPaths() {
  std::lock_guard<std::mutex> lock(mu_);
  return project_paths_;
}

PanelState InMemoryWorkspace::Panels() {
  std::lock_guard<std::mutex> lock(mu_);
  PanelState state;
  state.left = left_dock_;
  state.right = right_dock_;
  state.bottom = bottom_dock_;
  state.pane_count = static_cast<int>(panes_.size());
  state.active_pane_index = panes_.empty() ? -1 : static_cast<int>(active_pane_);
  return state;
}

bool InMemoryWorkspace::InsertText(const std::string& text) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* doc = ActiveDocumentLocked();
  if (!doc) return false;

  auto& buf = doc->buffer;
  std::vector<std::pair<size_t, size_t>> spans;
  for (const auto& sel : doc->selections) {
    const auto r = buf.Clip(sel);
    spans.emplace_back(buf.OffsetOf(r.start), buf.OffsetOf(r.end));
  }
  if (spans.empty()) spans.emplace_back(0, 0);
  std::sort(spans.begin(), spans.end());

  const std::string& old_text = buf.Text();
  std::string out;
  out.reserve(old_text.size() + text.size() * spans.size());
  std::vector<size_t> cursors;
  size_t prev = 0;
  for (auto [a, b] : spans) {
    a = std::max(a, prev);
    b = std::max(b, a);
    out.append(old_text, prev, a - prev);
    out += text;
    cursors.push_back(out.size());
    prev = b;
  }
  out.append(old_text, prev, std::string::npos);
  buf.SetText(std::move(out));

  doc->selections.clear();
  for (size_t c : cursors) {
    const auto p = buf.PositionOf(c);
    doc->selections.push_back(Range{p, p});
  }
  doc->modified = true;
  return true;
}

bool InMemoryWorkspace::SetSelections(const std::vector<Range>& ranges) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* doc = ActiveDocumentLocked();
  if (!doc) return false;
  if (ranges.empty()) return true;
  doc->selections.clear();
  for (const auto& r : ranges) doc->selections.push_back(doc->buffer.Clip(r));
  return true;
}

bool InMemoryWorkspace::GoToPosition(const Position& pos) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* doc = ActiveDocumentLocked();
  if (!doc) return false;
  const auto p = doc->buffer.Clip(pos);
  doc->selections = {Range{p, p}};
  return true;
}

bool InMemoryWorkspace::OpenFile(const std::string& path, std::optional<Position> pos, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  return OpenFileLocked(path, pos, err);
}

bool InMemoryWorkspace::SaveFile(const std::string& path, bool* saved, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  *saved = false;
  Document* doc = path.empty() ? ActiveDocumentLocked() : FindDocumentLocked(ResolvePathLocked(path));
  if (!doc) return true;
  if (!SaveDocumentLocked(doc, err)) return false;
  *saved = true;
  return true;
}

bool InMemoryWorkspace::CloseFile(const std::string& path, bool save, bool* closed, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  *closed = false;
  Document* doc = path.empty() ? ActiveDocumentLocked() : FindDocumentLocked(ResolvePathLocked(path));
  if (!doc) return true;
  if (save && doc->modified && !SaveDocumentLocked(doc, err)) return false;
  RemoveDocumentLocked(doc->id);
  *closed = true;
  return true;
}

bool InMemoryWorkspace::AddProjectPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  if (path.empty()) return false;
  std::error_code ec;
  if (!fs::is_directory(path, ec)) return false;
  auto canon = fs::canonical(path, ec);
  if (ec) return false;
  const auto normalized = canon.generic_string();
  if (std::find(project_paths_.begin(), project_paths_.end(), normalized) == project_paths_.end()) {
    project_paths_.push_back(normalized);
  }
  return true;
}

bool InMemoryWorkspace::RevealInTreeView(const std::string& path, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!OpenFileLocked(path, std::nullopt, err)) return false;
  left_dock_.visible = true;
  return true;
}

bool InMemoryWorkspace::SplitPane(SplitDirection direction, const std::string& path, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  const bool before = direction == SplitDirection::kLeft || direction == SplitDirection::kUp;
  const size_t insert_at = before ? active_pane_ : active_pane_ + 1;
  panes_.insert(panes_.begin() + static_cast<std::ptrdiff_t>(insert_at), Pane{});
  active_pane_ = insert_at;
  if (path.empty()) return true;

  // An editor already open elsewhere moves into the new pane.
  if (auto* doc = FindDocumentLocked(ResolvePathLocked(path))) {
    DetachFromPaneLocked(doc->id);
    auto& pane = panes_[active_pane_];
    pane.items.push_back(doc->id);
    pane.active_item = doc->id;
    return true;
  }
  return OpenFileLocked(path, std::nullopt, err);
}

bool InMemoryWorkspace::ClosePane(bool save_all, bool* closed, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  *closed = false;
  if (active_pane_ >= panes_.size()) return true;

  const auto items = panes_[active_pane_].items;
  if (save_all) {
    for (int id : items) {
      auto it = documents_.find(id);
      if (it == documents_.end() || !it->second.modified || !it->second.path) continue;
      if (!SaveDocumentLocked(&it->second, err)) return false;
    }
  }
  for (int id : items) documents_.erase(id);

  panes_.erase(panes_.begin() + static_cast<std::ptrdiff_t>(active_pane_));
  if (panes_.empty()) panes_.push_back(Pane{});
  if (active_pane_ >= panes_.size()) active_pane_ = panes_.size() - 1;
  *closed = true;
  return true;
}

std::optional<std::vector<TextMatch>> InMemoryWorkspace::FindText(const std::string& pattern,
                                                                  const FindOptions& opts,
                                                                  std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* doc = ActiveDocumentLocked();
  if (!doc) return std::nullopt;
  return doc->buffer.Find(pattern, opts, err);
}

void InMemoryWorkspace::OpenUntitled(const std::string& text) {
  std::lock_guard<std::mutex> lock(mu_);
  AddDocumentLocked(std::nullopt, text);
}

}  // namespace pulsar_mcp
