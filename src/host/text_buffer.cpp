#include "host/text_buffer.hpp"

#include <algorithm>
#include <iterator>
#include <regex>
#include <string>
#include <utility>

namespace pulsar_mcp {
namespace {

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool Before(const Position& a, const Position& b) {
  return a.row < b.row || (a.row == b.row && a.column < b.column);
}

}  // namespace

TextBuffer::TextBuffer(std::string text) : text_(std::move(text)) {
  Reindex();
}

void TextBuffer::SetText(std::string text) {
  text_ = std::move(text);
  Reindex();
}

void TextBuffer::Reindex() {
  line_starts_.clear();
  line_starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); i++) {
    if (text_[i] == '\n') line_starts_.push_back(i + 1);
  }
}

Position TextBuffer::Clip(const Position& pos) const {
  Position out;
  out.row = std::clamp(pos.row, 0, LineCount() - 1);
  const size_t start = line_starts_[static_cast<size_t>(out.row)];
  size_t end = text_.size();
  if (out.row + 1 < LineCount()) end = line_starts_[static_cast<size_t>(out.row) + 1] - 1;
  out.column = std::clamp(pos.column, 0, static_cast<int>(end - start));
  return out;
}

Range TextBuffer::Clip(const Range& range) const {
  Range out{Clip(range.start), Clip(range.end)};
  if (Before(out.end, out.start)) std::swap(out.start, out.end);
  return out;
}

size_t TextBuffer::OffsetOf(const Position& pos) const {
  const auto p = Clip(pos);
  return line_starts_[static_cast<size_t>(p.row)] + static_cast<size_t>(p.column);
}

Position TextBuffer::PositionOf(size_t offset) const {
  offset = std::min(offset, text_.size());
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const size_t row = static_cast<size_t>(std::distance(line_starts_.begin(), it)) - 1;
  return Position{static_cast<int>(row), static_cast<int>(offset - line_starts_[row])};
}

std::string TextBuffer::TextIn(const Range& range) const {
  const auto r = Clip(range);
  const size_t a = OffsetOf(r.start);
  const size_t b = OffsetOf(r.end);
  return text_.substr(a, b - a);
}

std::string TextBuffer::Line(int row) const {
  const auto r = static_cast<size_t>(std::clamp(row, 0, LineCount() - 1));
  const size_t start = line_starts_[r];
  size_t end = text_.size();
  if (r + 1 < line_starts_.size()) end = line_starts_[r + 1] - 1;
  return text_.substr(start, end - start);
}

std::optional<std::vector<TextMatch>> TextBuffer::Find(const std::string& pattern,
                                                       const FindOptions& opts,
                                                       std::string* err) const {
  if (pattern.empty()) {
    if (err) *err = "pattern must not be empty";
    return std::nullopt;
  }
  if (!opts.is_regex) return FindLiteral(pattern, opts.case_sensitive);

  auto flags = std::regex::ECMAScript;
  if (!opts.case_sensitive) flags |= std::regex::icase;

  std::regex re;
  try {
    re = std::regex(pattern, flags);
  } catch (const std::regex_error& e) {
    if (err) *err = std::string("Invalid regex: ") + e.what();
    return std::nullopt;
  }

  // std::regex matching recurses per input character, so each search is
  // confined to one line of bounded length.
  std::vector<TextMatch> out;
  for (int row = 0; row < LineCount(); row++) {
    const std::string line = Line(row);
    if (line.size() > kMaxRegexLineLength) {
      if (err) {
        *err = "Regex search is limited to lines of at most " + std::to_string(kMaxRegexLineLength) +
               " characters (line " + std::to_string(row) + " has " + std::to_string(line.size()) + ")";
      }
      return std::nullopt;
    }
    for (auto it = std::sregex_iterator(line.begin(), line.end(), re); it != std::sregex_iterator(); ++it) {
      const auto& m = *it;
      if (m.length() == 0) continue;
      const int col = static_cast<int>(m.position());
      TextMatch match;
      match.text = m.str();
      match.range = Range{Position{row, col}, Position{row, col + static_cast<int>(m.length())}};
      out.push_back(std::move(match));
    }
  }
  return out;
}

std::vector<TextMatch> TextBuffer::FindLiteral(const std::string& needle, bool case_sensitive) const {
  const std::string haystack = case_sensitive ? text_ : ToLower(text_);
  const std::string key = case_sensitive ? needle : ToLower(needle);
  std::vector<TextMatch> out;
  for (size_t pos = haystack.find(key); pos != std::string::npos; pos = haystack.find(key, pos + key.size())) {
    TextMatch match;
    match.text = text_.substr(pos, key.size());
    match.range = Range{PositionOf(pos), PositionOf(pos + key.size())};
    out.push_back(std::move(match));
  }
  return out;
}

}  // namespace pulsar_mcp
