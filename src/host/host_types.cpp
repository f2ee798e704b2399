#include "host/host_capabilities.hpp"

namespace pulsar_mcp {

std::optional<SplitDirection> ParseSplitDirection(const std::string& s) {
  if (s == "left") return SplitDirection::kLeft;
  if (s == "right") return SplitDirection::kRight;
  if (s == "up") return SplitDirection::kUp;
  if (s == "down") return SplitDirection::kDown;
  return std::nullopt;
}

const char* SplitDirectionName(SplitDirection d) {
  switch (d) {
    case SplitDirection::kLeft:
      return "left";
    case SplitDirection::kRight:
      return "right";
    case SplitDirection::kUp:
      return "up";
    case SplitDirection::kDown:
      return "down";
  }
  return "right";
}

nlohmann::json ToJson(const Position& p) {
  return {{"row", p.row}, {"column", p.column}};
}

nlohmann::json ToJson(const Range& r) {
  return {{"start", ToJson(r.start)}, {"end", ToJson(r.end)}};
}

nlohmann::json ToJson(const EditorState& e) {
  nlohmann::json j;
  j["path"] = e.path ? nlohmann::json(*e.path) : nlohmann::json(nullptr);
  j["content"] = e.content;
  j["cursorPosition"] = ToJson(e.cursor);
  j["grammar"] = e.grammar;
  j["modified"] = e.modified;
  return j;
}

nlohmann::json ToJson(const SelectionInfo& s) {
  return {{"text", s.text}, {"isEmpty", s.is_empty}, {"range", ToJson(s.range)}};
}

nlohmann::json ToJson(const OpenEditorInfo& e) {
  nlohmann::json j;
  j["path"] = e.path ? nlohmann::json(*e.path) : nlohmann::json(nullptr);
  j["modified"] = e.modified;
  j["active"] = e.active;
  return j;
}

nlohmann::json ToJson(const TextMatch& m) {
  return {{"text", m.text}, {"range", ToJson(m.range)}};
}

nlohmann::json ToJson(const PanelState& p) {
  auto dock = [](const DockState& d) { return nlohmann::json{{"visible", d.visible}, {"items", d.items}}; };
  nlohmann::json j;
  j["left"] = dock(p.left);
  j["right"] = dock(p.right);
  j["bottom"] = dock(p.bottom);
  j["panes"] = {{"count", p.pane_count}, {"activeIndex", p.active_pane_index}};
  return j;
}

}  // namespace pulsar_mcp
