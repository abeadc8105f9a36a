// sce/analysis/reference_index.hpp - Name -> statement reference model
#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <gsl/span>

#include "sce/basic/source_manager.hpp"
#include "sce/syntax/source_file.hpp"
#include "sce/syntax/ts_ll.hpp"

namespace sce
{

/**
 * A statement of the file and the names it mentions.
 *
 * `references` holds every distinct name whose nearest enclosing statement
 * is this one; `definitions` is the subset that appears in a binding
 * position (declared, assigned, bound as loop variable or parameter).
 * Names are views into the SourceFile's text.
 */
struct StatementNode
{
  ts_ll::Node node;
  SourceRange range;
  std::vector<std::string_view> references;
  std::vector<std::string_view> definitions;
};

/**
 * One name occurrence: an identifier, or a qualified name such as
 * `self.total` recorded whole.
 */
struct NameReference
{
  std::string_view name;
  ts_ll::Node node;
  SourceRange range;
  /// Nearest enclosing statement; null for identifiers outside any statement
  const StatementNode * statement = nullptr;
  bool is_definition = false;
};

/**
 * Statements and identifier occurrences of one file, built in a single
 * pre-order pass. Immutable after build; borrows from the SourceFile.
 */
class ReferenceIndex
{
public:
  [[nodiscard]] static ReferenceIndex build(const SourceFile & file);

  ReferenceIndex(const ReferenceIndex &) = delete;
  ReferenceIndex & operator=(const ReferenceIndex &) = delete;
  ReferenceIndex(ReferenceIndex &&) = default;
  ReferenceIndex & operator=(ReferenceIndex &&) = default;

  /// All statements in source (pre-order) order
  [[nodiscard]] const std::vector<StatementNode> & statements() const noexcept
  {
    return statements_;
  }

  /// All identifier occurrences in source order
  [[nodiscard]] const std::vector<NameReference> & references() const noexcept
  {
    return references_;
  }

  /**
   * Statements mentioning `name`, in source order. A statement appears once
   * per occurrence of the name inside it.
   */
  [[nodiscard]] gsl::span<const StatementNode * const> statements_referencing(
    std::string_view name) const;

  /**
   * Statements mentioning a qualified name that `name` is a proper prefix
   * of: `self.items.append(v)` for `self.items`, `xs.append(1)` for `xs`.
   */
  [[nodiscard]] gsl::span<const StatementNode * const> statements_extending(
    std::string_view name) const;

  /// The StatementNode for a statement node of the tree; null if not a statement
  [[nodiscard]] const StatementNode * find_statement(const ts_ll::Node & node) const;

private:
  ReferenceIndex() = default;

  std::vector<StatementNode> statements_;
  std::vector<NameReference> references_;
  std::unordered_map<const void *, size_t> statement_by_node_;
  std::unordered_map<std::string_view, std::vector<const StatementNode *>> by_name_;
  std::unordered_map<std::string_view, std::vector<const StatementNode *>> by_prefix_;
};

}  // namespace sce
