// sce/analysis/slicer.hpp - Name-based program slicing
//
// A slice keeps every statement transitively linked to the name under the
// cursor through shared names, restricted to one side of the cursor, and
// reports everything else as ranges to remove.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "sce/analysis/reference_index.hpp"
#include "sce/basic/source_manager.hpp"
#include "sce/syntax/source_file.hpp"

namespace sce
{

enum class SliceDirection : uint8_t {
  Backward,  ///< keep statements starting at or before the seed
  Forward,   ///< keep statements starting at or after the seed
};

[[nodiscard]] std::string_view to_string(SliceDirection direction) noexcept;

/// Accepts "backward"/"forward" in any case
[[nodiscard]] std::optional<SliceDirection> parse_slice_direction(std::string_view name);

enum class SliceScope : uint8_t {
  File,      ///< the whole file participates
  Function,  ///< only the function enclosing the seed
};

[[nodiscard]] std::string_view to_string(SliceScope scope) noexcept;
[[nodiscard]] std::optional<SliceScope> parse_slice_scope(std::string_view name);

struct SliceOptions
{
  SliceScope scope = SliceScope::File;
  bool merge_whitespace_gaps = true;
};

/**
 * Starting point of a slice.
 *
 * `reference` is the chosen identifier occurrence. When the cursor is near
 * no identifier it is null and `statement` is the innermost statement at
 * the cursor, if any. `position` is the byte offset the directional filter
 * compares statement starts against.
 */
struct SliceSeed
{
  const NameReference * reference = nullptr;
  const StatementNode * statement = nullptr;
  uint32_t position = 0;

  [[nodiscard]] bool empty() const noexcept { return reference == nullptr && statement == nullptr; }
};

/**
 * Pick the seed for a cursor at byte `offset`.
 *
 * An identifier containing the cursor (end inclusive) wins. Otherwise
 * Backward takes the last identifier starting at or before the cursor and
 * Forward the first identifier ending at or after it.
 */
[[nodiscard]] SliceSeed select_seed(
  const SourceFile & file, const ReferenceIndex & index, uint32_t offset,
  SliceDirection direction);

struct SliceResult
{
  /// Kept statements in source order
  std::vector<const StatementNode *> kept;
  /// Byte ranges to remove, ascending and disjoint
  std::vector<SourceRange> removed;
};

class Slicer
{
public:
  Slicer(const SourceFile & file, const ReferenceIndex & index, SliceOptions options = {})
  : file_(file), index_(index), options_(options)
  {
  }

  [[nodiscard]] SliceResult slice(const SliceSeed & seed, SliceDirection direction) const;

  /// select_seed + slice, with the removed ranges as editor positions
  [[nodiscard]] std::vector<TextRange> slice_at(uint32_t offset, SliceDirection direction) const;

private:
  const SourceFile & file_;
  const ReferenceIndex & index_;
  SliceOptions options_;
};

}  // namespace sce
