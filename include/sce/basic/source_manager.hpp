// sce/basic/source_manager.hpp - Source positions, ranges and text management
//
// Byte offsets are the internal currency (tree-sitter works in bytes).
// Points are what editors exchange: zero-based line plus a column counted
// in the configured PositionEncoding.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sce
{

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A range of source bytes following the half-open convention [begin, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return end_ > begin_ ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool empty() const noexcept { return end_ <= begin_; }

  /// Check if a byte offset lies within the range (end inclusive when asked)
  [[nodiscard]] constexpr bool contains(uint32_t offset, bool inclusive_end = false) const noexcept
  {
    return offset >= begin_ && (inclusive_end ? offset <= end_ : offset < end_);
  }

  /// Check if another range is fully contained within this range
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return other.begin_ >= begin_ && other.end_ <= end_;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t begin_ = 0;
  uint32_t end_ = 0;
};

// ============================================================================
// Point / TextRange - Editor-facing positions
// ============================================================================

/**
 * Zero-based (line, column) position. The column unit is given by the
 * PositionEncoding of the SourceManager that produced it.
 */
struct Point
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool operator==(const Point & other) const noexcept
  {
    return line == other.line && column == other.column;
  }
  [[nodiscard]] constexpr bool operator!=(const Point & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(const Point & other) const noexcept
  {
    return line < other.line || (line == other.line && column < other.column);
  }
  [[nodiscard]] constexpr bool operator<=(const Point & other) const noexcept
  {
    return !(other < *this);
  }
};

/**
 * Ordered pair of points with start <= end.
 */
struct TextRange
{
  Point start;
  Point end;

  [[nodiscard]] constexpr bool operator==(const TextRange & other) const noexcept
  {
    return start == other.start && end == other.end;
  }
  [[nodiscard]] constexpr bool operator!=(const TextRange & other) const noexcept
  {
    return !(*this == other);
  }
};

/**
 * Unit in which Point::column is counted.
 */
enum class PositionEncoding : uint8_t {
  Utf8,   ///< bytes
  Utf16,  ///< UTF-16 code units
  Utf32,  ///< Unicode code points
};

[[nodiscard]] std::string_view to_string(PositionEncoding encoding) noexcept;
[[nodiscard]] std::optional<PositionEncoding> parse_position_encoding(std::string_view name);

// ============================================================================
// SourceManager - Source text and location services
// ============================================================================

/**
 * Owns source content and converts between byte offsets and Points.
 *
 * Line start offsets are pre-computed; column conversion decodes UTF-8 on the
 * requested line only.
 */
class SourceManager
{
public:
  SourceManager() { build_line_table(); }

  explicit SourceManager(std::string source, PositionEncoding encoding = PositionEncoding::Utf32)
  : source_(std::move(source)), encoding_(encoding)
  {
    build_line_table();
  }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] PositionEncoding encoding() const noexcept { return encoding_; }

  /// Get the number of lines (a trailing newline opens an empty last line)
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Get the byte offset of a line start (clamped to the end of the source)
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept
  {
    if (line_index >= line_offsets_.size()) {
      return static_cast<uint32_t>(source_.size());
    }
    return line_offsets_[line_index];
  }

  /// Get the content of a line without its newline (0-indexed)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Zero-based line containing the byte offset
  [[nodiscard]] uint32_t get_line_index(uint32_t offset) const noexcept;

  /// Get a slice of source by range (clamped)
  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept
  {
    const auto size = static_cast<uint32_t>(source_.size());
    const uint32_t begin = range.begin() > size ? size : range.begin();
    uint32_t end = range.end() > size ? size : range.end();
    if (end < begin) end = begin;
    return std::string_view(source_).substr(begin, end - begin);
  }

  // ===========================================================================
  // Location Conversion
  // ===========================================================================

  /// Byte offset -> Point in this manager's encoding
  [[nodiscard]] Point get_point(uint32_t offset) const noexcept;

  /// Point -> byte offset; out-of-range lines/columns clamp to the nearest offset
  [[nodiscard]] uint32_t get_offset(Point point) const noexcept;

  [[nodiscard]] TextRange to_text_range(SourceRange range) const noexcept
  {
    return {get_point(range.begin()), get_point(range.end())};
  }

  [[nodiscard]] SourceRange to_source_range(const TextRange & range) const noexcept
  {
    return {get_offset(range.start), get_offset(range.end)};
  }

  /// Count encoding units in a byte slice of UTF-8 text
  [[nodiscard]] static uint32_t count_units(std::string_view text, PositionEncoding encoding);

private:
  void build_line_table();

  std::string source_;                  ///< Source content
  PositionEncoding encoding_ = PositionEncoding::Utf32;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace sce
