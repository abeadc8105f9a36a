// sce/syntax/grammar.hpp - Per-grammar node-kind capability tables
//
// Each supported grammar maps its native tree-sitter node kinds onto the
// normalized notions the analysis layers work with (identifier, statement,
// call, function definition, ...). Adding a language means adding one
// table in grammars.cpp; the slicer and inliner never branch on language.
//
#pragma once

#include <tree_sitter/api.h>

#include <algorithm>
#include <string_view>
#include <vector>

#include "sce/syntax/language.hpp"

namespace sce
{

using KindList = std::vector<std::string_view>;

[[nodiscard]] inline bool contains_kind(const KindList & kinds, std::string_view kind) noexcept
{
  return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

/**
 * An identifier sitting inside `field` of a node of `kind` is a binding
 * (declaration, assignment target, loop variable, parameter). An empty
 * field means anywhere inside the node.
 */
struct BindingField
{
  std::string_view kind;
  std::string_view field;
};

/**
 * A member access of `kind` (`self.total`, `p->next`) names one thing when
 * its `object_field` child is a name itself; the whole text is then indexed
 * as a single name.
 */
struct QualifiedName
{
  std::string_view kind;
  std::string_view object_field;
};

struct Grammar
{
  GrammarId id = GrammarId::C;
  const TSLanguage * (*language)() = nullptr;

  // --- Names -----------------------------------------------------------------
  KindList identifier_kinds;
  std::vector<QualifiedName> qualified_names;
  /// Receiver identifiers (`self`); a qualified name never extends one
  KindList receiver_names;
  std::vector<BindingField> binding_fields;

  // --- Statements ------------------------------------------------------------
  /// Node kinds that are statements wherever they appear
  KindList statement_kinds;
  /// Every named, non-comment child of these is a statement (expression languages)
  KindList statement_container_kinds;
  /// Braced/indented bodies: never removed as a unit, their statements are
  KindList block_kinds;
  /// Non-block parents whose statement children can be removed one by one
  KindList sequence_kinds;
  KindList comment_kinds;

  // --- Calls -----------------------------------------------------------------
  KindList call_kinds;
  std::string_view call_arguments_field = "arguments";
  /// `name=value` arguments bound by parameter name (empty: none)
  std::string_view keyword_argument_kind;
  /// Wrapper around each argument expression (empty: none)
  std::string_view argument_wrapper_kind;

  // --- Function definitions --------------------------------------------------
  KindList function_kinds;
  std::string_view function_body_field = "body";
  /// Field holding the parameter list; empty means search outside the body
  std::string_view parameters_field;
  /// Field holding a lone, unparenthesized parameter (`x => x + 1`)
  std::string_view single_parameter_field;
  KindList parameter_list_kinds;
  KindList skipped_parameter_kinds;
  /// Fields of a parameter node that hold the bound name, tried in order
  KindList parameter_name_fields;
  KindList return_kinds;
  /// The final expression of a body is its value (Rust, Ruby)
  bool implicit_return = false;
  KindList literal_kinds;
  /**
   * Declaration of a hoisted argument. Placeholders: {name} temp name,
   * {decl} parameter declaration text with the temp name, {value} argument.
   */
  std::string_view temp_format;
};

/// Capability table for a grammar (static storage)
[[nodiscard]] const Grammar & grammar_for(GrammarId id);

}  // namespace sce
