// sce/basic/source_manager.cpp - Source text and position conversion
#include "sce/basic/source_manager.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sce
{

namespace
{

// Returns (code point, byte length). Invalid sequences decode as U+FFFD, 1 byte.
std::pair<uint32_t, size_t> decode_utf8(std::string_view s, size_t i)
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) return {b0, 1};
  if ((b0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if ((b1 & 0xC0) == 0x80) {
      return {((b0 & 0x1Fu) << 6) | (b1 & 0x3Fu), 2};
    }
  }
  if ((b0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    if (((b1 & 0xC0) == 0x80) && ((b2 & 0xC0) == 0x80)) {
      return {((b0 & 0x0Fu) << 12) | ((b1 & 0x3Fu) << 6) | (b2 & 0x3Fu), 3};
    }
  }
  if ((b0 & 0xF8) == 0xF0 && i + 3 < s.size()) {
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    const auto b3 = static_cast<unsigned char>(s[i + 3]);
    if (((b1 & 0xC0) == 0x80) && ((b2 & 0xC0) == 0x80) && ((b3 & 0xC0) == 0x80)) {
      const uint32_t cp = ((b0 & 0x07u) << 18) | ((b1 & 0x3Fu) << 12) | ((b2 & 0x3Fu) << 6) |
                          (b3 & 0x3Fu);
      return {cp, 4};
    }
  }
  return {0xFFFDu, 1};
}

uint32_t units_for(uint32_t cp, size_t byte_len, PositionEncoding encoding)
{
  switch (encoding) {
    case PositionEncoding::Utf8:
      return static_cast<uint32_t>(byte_len);
    case PositionEncoding::Utf16:
      return cp > 0xFFFFu ? 2 : 1;
    case PositionEncoding::Utf32:
      return 1;
  }
  return 1;
}

std::string lowercase(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

std::string_view to_string(PositionEncoding encoding) noexcept
{
  switch (encoding) {
    case PositionEncoding::Utf8:
      return "utf-8";
    case PositionEncoding::Utf16:
      return "utf-16";
    case PositionEncoding::Utf32:
      return "utf-32";
  }
  return "utf-32";
}

std::optional<PositionEncoding> parse_position_encoding(std::string_view name)
{
  const std::string n = lowercase(name);
  if (n == "utf-8" || n == "utf8" || n == "bytes") return PositionEncoding::Utf8;
  if (n == "utf-16" || n == "utf16") return PositionEncoding::Utf16;
  if (n == "utf-32" || n == "utf32" || n == "characters") return PositionEncoding::Utf32;
  return std::nullopt;
}

uint32_t SourceManager::count_units(std::string_view text, PositionEncoding encoding)
{
  if (encoding == PositionEncoding::Utf8) {
    return static_cast<uint32_t>(text.size());
  }
  uint32_t units = 0;
  size_t i = 0;
  while (i < text.size()) {
    const auto [cp, len] = decode_utf8(text, i);
    units += units_for(cp, len, encoding);
    i += len;
  }
  return units;
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;  // drop '\n'
  }
  return std::string_view(source_).substr(start, end - start);
}

uint32_t SourceManager::get_line_index(uint32_t offset) const noexcept
{
  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return 0;
  }
  return static_cast<uint32_t>(std::distance(line_offsets_.begin(), it) - 1);
}

Point SourceManager::get_point(uint32_t offset) const noexcept
{
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  const uint32_t line = get_line_index(offset);
  const uint32_t line_start = line_offsets_[line];
  const std::string_view prefix = std::string_view(source_).substr(line_start, offset - line_start);
  return {line, count_units(prefix, encoding_)};
}

uint32_t SourceManager::get_offset(Point point) const noexcept
{
  if (point.line >= line_offsets_.size()) {
    return static_cast<uint32_t>(source_.size());
  }

  const uint32_t line_start = line_offsets_[point.line];
  const std::string_view line = get_line(point.line);

  uint32_t units = 0;
  size_t i = 0;
  while (i < line.size() && units < point.column) {
    const auto [cp, len] = decode_utf8(line, i);
    const uint32_t u = units_for(cp, len, encoding_);
    if (units + u > point.column) {
      break;  // column points into the middle of a character
    }
    units += u;
    i += len;
  }
  return line_start + static_cast<uint32_t>(i);
}

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace sce
