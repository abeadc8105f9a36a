// sce/edit/text_edit.hpp - Range merging and text rewriting
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "sce/basic/source_manager.hpp"

namespace sce
{

// ============================================================================
// Range merging
// ============================================================================

/**
 * Sort byte ranges by start and merge any that overlap or touch. The result
 * is ascending and pairwise disjoint; empty ranges are dropped. With
 * `merge_whitespace_gaps`, ranges separated only by whitespace in `source`
 * are joined as well, so that two adjacent removed statements become a
 * single range.
 */
[[nodiscard]] std::vector<SourceRange> merge_source_ranges(
  std::string_view source, std::vector<SourceRange> ranges, bool merge_whitespace_gaps);

// ============================================================================
// Text rewriting
// ============================================================================

/**
 * Replace `range` (bytes of the original text) with `text`.
 */
struct Replacement
{
  SourceRange range;
  std::string text;
};

/**
 * Apply non-overlapping replacements to `text`. Edits are applied in offset
 * order regardless of input order; an edit overlapping an earlier one is
 * skipped.
 */
[[nodiscard]] std::string apply_replacements(std::string_view text, std::vector<Replacement> edits);

struct RemovalResult
{
  std::string content;
  Point cursor;
};

/**
 * Delete `ranges` from the source the way an editor client applies a slice.
 *
 * Lines that lost text and are left blank are dropped entirely; text
 * surviving around a removed range stays on its line. The cursor is moved
 * to where its character ended up (start of the next surviving line if its
 * own line was dropped).
 */
[[nodiscard]] RemovalResult apply_removals(
  const SourceManager & source, gsl::span<const TextRange> ranges, Point cursor);

}  // namespace sce
