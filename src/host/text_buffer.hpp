#pragma once

#include "host/host_capabilities.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

// Longest line a regex search will run over.
constexpr size_t kMaxRegexLineLength = 2000;

// Text split into '\n'-terminated rows; columns count bytes.
class TextBuffer {
 public:
  explicit TextBuffer(std::string text = {});

  const std::string& Text() const { return text_; }
  void SetText(std::string text);
  int LineCount() const { return static_cast<int>(line_starts_.size()); }

  Position Clip(const Position& pos) const;
  // Clips both ends and orders them so start <= end.
  Range Clip(const Range& range) const;

  size_t OffsetOf(const Position& pos) const;
  Position PositionOf(size_t offset) const;
  std::string TextIn(const Range& range) const;
  // Row text without its line terminator.
  std::string Line(int row) const;

  // Literal patterns match anywhere, including across lines. Regex patterns
  // are matched line by line, so `^` and `$` anchor at line boundaries.
  std::optional<std::vector<TextMatch>> Find(const std::string& pattern,
                                             const FindOptions& opts,
                                             std::string* err) const;

 private:
  void Reindex();
  std::vector<TextMatch> FindLiteral(const std::string& needle, bool case_sensitive) const;

  std::string text_;
  std::vector<size_t> line_starts_;
};

}  // namespace pulsar_mcp
