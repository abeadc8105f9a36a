// sce/analysis/slicer.cpp - Name-based program slicing
#include "sce/analysis/slicer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <functional>
#include <string>
#include <unordered_set>

#include "sce/edit/text_edit.hpp"

namespace sce
{

namespace
{

std::string lowercase(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

std::string_view to_string(SliceDirection direction) noexcept
{
  switch (direction) {
    case SliceDirection::Backward:
      return "BACKWARD";
    case SliceDirection::Forward:
      return "FORWARD";
  }
  return "BACKWARD";
}

std::optional<SliceDirection> parse_slice_direction(std::string_view name)
{
  const std::string n = lowercase(name);
  if (n == "backward") return SliceDirection::Backward;
  if (n == "forward") return SliceDirection::Forward;
  return std::nullopt;
}

std::string_view to_string(SliceScope scope) noexcept
{
  switch (scope) {
    case SliceScope::File:
      return "file";
    case SliceScope::Function:
      return "function";
  }
  return "file";
}

std::optional<SliceScope> parse_slice_scope(std::string_view name)
{
  const std::string n = lowercase(name);
  if (n == "file") return SliceScope::File;
  if (n == "function") return SliceScope::Function;
  return std::nullopt;
}

// ============================================================================
// Seed selection
// ============================================================================

SliceSeed select_seed(
  const SourceFile & file, const ReferenceIndex & index, uint32_t offset,
  SliceDirection direction)
{
  const auto & refs = index.references();
  const NameReference * chosen = nullptr;

  // On the identifier; a cursor just past its end still counts.
  for (const NameReference & ref : refs) {
    if (ref.range.contains(offset)) {
      chosen = &ref;
      break;
    }
    if (!chosen && ref.range.contains(offset, /*inclusive_end=*/true)) {
      chosen = &ref;
    }
  }

  if (!chosen) {
    if (direction == SliceDirection::Backward) {
      for (const NameReference & ref : refs) {
        if (ref.range.begin() > offset) break;
        chosen = &ref;
      }
    } else {
      for (const NameReference & ref : refs) {
        if (ref.range.end() >= offset) {
          chosen = &ref;
          break;
        }
      }
    }
  }

  SliceSeed seed;
  if (chosen) {
    seed.reference = chosen;
    seed.statement = chosen->statement;
    seed.position = chosen->statement ? chosen->statement->range.begin() : chosen->range.begin();
    spdlog::debug(
      "seed '{}' at byte {} ({})", chosen->name, chosen->range.begin(),
      chosen->statement ? "in statement" : "outside any statement");
    return seed;
  }

  const ts_ll::Node stmt =
    file.innermost_at(offset, [&](const ts_ll::Node & n) { return file.is_statement(n); });
  seed.statement = index.find_statement(stmt);
  if (seed.statement) {
    seed.position = seed.statement->range.begin();
  }
  return seed;
}

// ============================================================================
// Slicing
// ============================================================================

SliceResult Slicer::slice(const SliceSeed & seed, SliceDirection direction) const
{
  SliceResult result;
  if (seed.empty()) {
    spdlog::warn("no identifier or statement at the cursor; nothing to slice");
    return result;
  }

  ts_ll::Node scope;
  if (options_.scope == SliceScope::Function) {
    scope = file_.enclosing_function(seed.reference ? seed.reference->node : seed.statement->node);
  }

  const auto eligible = [&](const StatementNode & s) {
    if (!scope.is_null() && !scope.range().contains(s.range)) {
      return false;
    }
    return direction == SliceDirection::Backward ? s.range.begin() <= seed.position
                                                 : s.range.begin() >= seed.position;
  };

  // --- Fixpoint over names ---------------------------------------------------
  std::unordered_set<const StatementNode *> kept;
  if (seed.statement) {
    kept.insert(seed.statement);
  }

  if (seed.reference) {
    std::unordered_set<std::string_view> visited{seed.reference->name};
    std::deque<std::string_view> worklist{seed.reference->name};
    std::unordered_set<const StatementNode *> expanded;

    while (!worklist.empty()) {
      const std::string_view name = worklist.front();
      worklist.pop_front();

      for (const auto matches :
           {index_.statements_referencing(name), index_.statements_extending(name)}) {
        for (const StatementNode * s : matches) {
          if (!eligible(*s) || !expanded.insert(s).second) {
            continue;
          }
          kept.insert(s);
          for (const auto * names : {&s->references, &s->definitions}) {
            for (const std::string_view n : *names) {
              if (visited.insert(n).second) {
                worklist.push_back(n);
                spdlog::trace("frontier += '{}'", n);
              }
            }
          }
        }
      }
    }
    spdlog::debug("slice from '{}': {} names, {} statements kept", seed.reference->name,
                  visited.size(), kept.size());
  } else {
    spdlog::warn("cursor is not near an identifier; keeping only the statement under it");
  }

  result.kept.assign(kept.begin(), kept.end());
  std::sort(result.kept.begin(), result.kept.end(), std::less<const StatementNode *>());

  // --- Removal ranges --------------------------------------------------------
  // Statements containing a kept statement stay; their other content may go.
  std::unordered_set<const void *> keep_ids;
  std::unordered_set<const void *> container_ids;
  for (const StatementNode * s : result.kept) {
    keep_ids.insert(s->node.id());
    for (ts_ll::Node p = s->node.parent(); !p.is_null(); p = p.parent()) {
      if (!container_ids.insert(p.id()).second) break;
    }
  }

  std::vector<SourceRange> removed;
  const ts_ll::Node walk_root = scope.is_null() ? file_.root() : scope;
  ts_ll::walk_depth_first(walk_root, [&](const ts_ll::Node & node) {
    if (!file_.is_statement(node) || file_.is_block(node) ||
        !file_.is_removable_position(node)) {
      return true;
    }
    if (keep_ids.count(node.id()) || container_ids.count(node.id())) {
      return true;
    }
    removed.push_back(node.range());
    return false;
  });

  result.removed = merge_source_ranges(
    file_.source().get_source(), std::move(removed), options_.merge_whitespace_gaps);
  return result;
}

std::vector<TextRange> Slicer::slice_at(uint32_t offset, SliceDirection direction) const
{
  const SliceSeed seed = select_seed(file_, index_, offset, direction);
  const SliceResult result = slice(seed, direction);

  std::vector<TextRange> ranges;
  ranges.reserve(result.removed.size());
  for (const SourceRange r : result.removed) {
    ranges.push_back(file_.source().to_text_range(r));
  }
  return ranges;
}

}  // namespace sce
