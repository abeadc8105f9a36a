// sce/edit/text_edit.cpp - Range merging and text rewriting
#include "sce/edit/text_edit.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sce
{

namespace
{

bool is_blank(std::string_view s)
{
  return std::all_of(
    s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::vector<SourceRange> merge_source_ranges(
  std::string_view source, std::vector<SourceRange> ranges, bool merge_whitespace_gaps)
{
  ranges.erase(
    std::remove_if(ranges.begin(), ranges.end(), [](SourceRange r) { return r.empty(); }),
    ranges.end());
  std::sort(ranges.begin(), ranges.end(), [](SourceRange a, SourceRange b) {
    return a.begin() < b.begin() || (a.begin() == b.begin() && a.end() < b.end());
  });

  std::vector<SourceRange> merged;
  for (const SourceRange r : ranges) {
    if (!merged.empty()) {
      const SourceRange last = merged.back();
      bool join = r.begin() <= last.end();
      if (!join && merge_whitespace_gaps && r.begin() <= source.size()) {
        join = is_blank(source.substr(last.end(), r.begin() - last.end()));
      }
      if (join) {
        merged.back() = SourceRange(last.begin(), std::max(last.end(), r.end()));
        continue;
      }
    }
    merged.push_back(r);
  }
  return merged;
}

std::string apply_replacements(std::string_view text, std::vector<Replacement> edits)
{
  std::stable_sort(edits.begin(), edits.end(), [](const Replacement & a, const Replacement & b) {
    return a.range.begin() < b.range.begin();
  });

  std::string out;
  out.reserve(text.size());
  uint32_t pos = 0;
  for (const Replacement & e : edits) {
    if (e.range.begin() < pos || e.range.end() > text.size()) {
      spdlog::warn(
        "skipping overlapping or out-of-range edit [{}, {})", e.range.begin(), e.range.end());
      continue;
    }
    out.append(text.substr(pos, e.range.begin() - pos));
    out.append(e.text);
    pos = e.range.end();
  }
  out.append(text.substr(pos));
  return out;
}

RemovalResult apply_removals(
  const SourceManager & source, gsl::span<const TextRange> ranges, Point cursor)
{
  const std::string_view text = source.get_source();

  std::vector<SourceRange> bytes;
  bytes.reserve(ranges.size());
  for (const TextRange & r : ranges) {
    bytes.push_back(source.to_source_range(r));
  }
  bytes = merge_source_ranges(text, std::move(bytes), /*merge_whitespace_gaps=*/false);

  std::vector<bool> removed(text.size(), false);
  for (const SourceRange r : bytes) {
    for (uint32_t i = r.begin(); i < r.end() && i < text.size(); ++i) {
      removed[i] = true;
    }
  }

  const uint32_t cursor_offset = source.get_offset(cursor);
  const uint32_t cursor_line = std::min<uint32_t>(
    cursor.line, static_cast<uint32_t>(source.get_line_count() - 1));

  RemovalResult result;
  uint32_t out_line = 0;
  bool first = true;
  bool cursor_placed = false;

  for (uint32_t line = 0; line < source.get_line_count(); ++line) {
    const uint32_t begin = source.get_line_offset(line);
    const auto end = static_cast<uint32_t>(begin + source.get_line(line).size());

    std::string kept;
    std::string kept_before_cursor;
    bool touched = end < text.size() && removed[end];  // the newline itself
    for (uint32_t i = begin; i < end; ++i) {
      if (removed[i]) {
        touched = true;
        continue;
      }
      kept.push_back(text[i]);
      if (line == cursor_line && i < cursor_offset) {
        kept_before_cursor.push_back(text[i]);
      }
    }

    const bool dropped = touched && is_blank(kept);
    if (line == cursor_line) {
      result.cursor = {out_line, 0};
      if (!dropped) {
        result.cursor.column = SourceManager::count_units(kept_before_cursor, source.encoding());
      }
      cursor_placed = true;
    }
    if (dropped) {
      continue;
    }

    if (!first) result.content.push_back('\n');
    result.content += kept;
    first = false;
    ++out_line;
  }

  if (!cursor_placed) {
    result.cursor = {out_line, 0};
  }
  return result;
}

}  // namespace sce
