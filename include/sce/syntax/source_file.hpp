// sce/syntax/source_file.hpp - Parsed source file with normalized node queries
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "sce/basic/error.hpp"
#include "sce/basic/source_manager.hpp"
#include "sce/syntax/grammar.hpp"
#include "sce/syntax/language.hpp"
#include "sce/syntax/ts_ll.hpp"

namespace sce
{

/**
 * A source text, its grammar and its concrete syntax tree.
 *
 * Nodes handed out by this class borrow from the tree and the source text;
 * they are valid for the lifetime of the SourceFile. Not copyable or
 * movable so that borrowed string_views stay stable.
 */
class SourceFile
{
public:
  using NodePredicate = std::function<bool(const ts_ll::Node &)>;

  /**
   * Parse `content` with the given grammar.
   *
   * A tree with syntax errors is still returned (and logged); ParseFailure is
   * only reported when no tree can be produced at all.
   */
  [[nodiscard]] static Result<std::unique_ptr<SourceFile>> parse(
    std::string filename, std::string content, GrammarId grammar,
    PositionEncoding encoding = PositionEncoding::Utf32);

  SourceFile(const SourceFile &) = delete;
  SourceFile & operator=(const SourceFile &) = delete;

  [[nodiscard]] const std::string & filename() const noexcept { return filename_; }
  [[nodiscard]] const SourceManager & source() const noexcept { return source_; }
  [[nodiscard]] const Grammar & grammar() const noexcept { return *grammar_; }
  [[nodiscard]] ts_ll::Node root() const noexcept { return tree_.root_node(); }

  // ===========================================================================
  // Normalized node classification
  // ===========================================================================

  [[nodiscard]] bool is_identifier(const ts_ll::Node & node) const;

  /// `self.total`, `p->next`: a member access whose object is itself a name
  [[nodiscard]] bool is_qualified_name(const ts_ll::Node & node) const
  {
    return !qualifier(node).is_null();
  }

  /// Object part of a qualified name (`self` in `self.total`); null otherwise
  [[nodiscard]] ts_ll::Node qualifier(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_statement(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_block(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_comment(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_call_expression(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_function_definition(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_return(const ts_ll::Node & node) const;
  [[nodiscard]] bool is_literal(const ts_ll::Node & node) const;

  /**
   * Whether the statement sits directly in a statement sequence (a block,
   * the file root, a case arm) so that deleting it leaves valid structure.
   * `if (c) x = 1;` is a statement whose removal would not.
   */
  [[nodiscard]] bool is_removable_position(const ts_ll::Node & statement) const;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::string_view text(const ts_ll::Node & node) const noexcept
  {
    return node.text(source_);
  }

  [[nodiscard]] TextRange text_range(const ts_ll::Node & node) const noexcept
  {
    return source_.to_text_range(node.range());
  }

  /// Innermost statement containing `node` (the node itself included); null if none
  [[nodiscard]] ts_ll::Node enclosing_statement(ts_ll::Node node) const;

  /// Innermost function definition containing `node`; null if none
  [[nodiscard]] ts_ll::Node enclosing_function(ts_ll::Node node) const;

  /**
   * Innermost node containing `offset` that satisfies `pred`.
   *
   * A node ending exactly at `offset` still counts when no node starts
   * there, so a cursor placed just after an identifier selects it.
   */
  [[nodiscard]] ts_ll::Node innermost_at(uint32_t offset, const NodePredicate & pred) const;

  /// Leading whitespace of the line containing `offset`
  [[nodiscard]] std::string_view line_indent(uint32_t offset) const noexcept;

private:
  SourceFile(std::string filename, std::string content, const Grammar & grammar,
             PositionEncoding encoding);

  std::string filename_;
  SourceManager source_;
  const Grammar * grammar_ = nullptr;
  ts_ll::Tree tree_;
};

}  // namespace sce
