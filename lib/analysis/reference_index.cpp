// sce/analysis/reference_index.cpp - Reference model construction
#include "sce/analysis/reference_index.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sce
{

namespace
{

constexpr size_t k_no_statement = static_cast<size_t>(-1);

/**
 * Whether `name` is worth recording as the prefix of a longer qualified name:
 * `self.items` in `self.items.append`, `xs` in `xs.append`, but not a
 * receiver such as `self`.
 */
bool is_extensible_prefix(const SourceFile & file, const ts_ll::Node & node)
{
  if (file.is_qualified_name(node)) {
    return true;
  }
  return file.is_identifier(node) &&
         !contains_kind(file.grammar().receiver_names, file.text(node));
}

/**
 * Whether `identifier` sits in a binding position. The nearest ancestor (up
 * to `stop`) of a binding kind decides: `y` in `int x = y;` reaches the
 * init_declarator first and is outside its declarator field.
 */
bool is_binding_occurrence(
  const Grammar & grammar, const ts_ll::Node & identifier, const ts_ll::Node & stop)
{
  const SourceRange range = identifier.range();
  if (!stop.is_null() && identifier == stop) {
    return false;  // a bare name standing as a statement is a use
  }
  for (ts_ll::Node a = identifier.parent(); !a.is_null(); a = a.parent()) {
    const std::string_view kind = a.kind();
    bool matched_kind = false;
    for (const auto & binding : grammar.binding_fields) {
      if (binding.kind != kind) continue;
      matched_kind = true;
      if (binding.field.empty()) return true;
      for (const ts_ll::Node & f : a.children_by_field(binding.field)) {
        if (f.range().contains(range)) return true;
      }
    }
    if (matched_kind) return false;
    if (!stop.is_null() && a == stop) break;
  }
  return false;
}

void add_unique(std::vector<std::string_view> & names, std::string_view name)
{
  if (std::find(names.begin(), names.end(), name) == names.end()) {
    names.push_back(name);
  }
}

}  // namespace

ReferenceIndex ReferenceIndex::build(const SourceFile & file)
{
  ReferenceIndex index;

  // Statement slots are referenced by position until the vector is final.
  std::vector<size_t> ref_statement;
  std::vector<std::pair<std::string_view, size_t>> prefix_statement;

  ts_ll::walk_depth_first(file.root(), [&](const ts_ll::Node & node) {
    if (file.is_statement(node)) {
      index.statement_by_node_.emplace(node.id(), index.statements_.size());
      index.statements_.push_back(StatementNode{node, node.range(), {}, {}});
    }

    const bool qualified = file.is_qualified_name(node);
    if (qualified || file.is_identifier(node)) {
      const std::string_view name = file.text(node);
      if (name.empty()) {
        return true;  // zero-width MISSING node from error recovery
      }

      size_t slot = k_no_statement;
      const ts_ll::Node stmt = file.enclosing_statement(node);
      if (!stmt.is_null()) {
        // Pre-order: the enclosing statement is already registered.
        if (auto it = index.statement_by_node_.find(stmt.id());
            it != index.statement_by_node_.end()) {
          slot = it->second;
        }
      }

      NameReference ref;
      ref.name = name;
      ref.node = node;
      ref.range = node.range();
      ref.is_definition = is_binding_occurrence(file.grammar(), node, stmt);
      index.references_.push_back(ref);
      ref_statement.push_back(slot);

      if (slot != k_no_statement) {
        StatementNode & s = index.statements_[slot];
        add_unique(s.references, name);
        if (ref.is_definition) {
          add_unique(s.definitions, name);
        }
        if (qualified) {
          for (ts_ll::Node q = file.qualifier(node); !q.is_null() && is_extensible_prefix(file, q);
               q = file.qualifier(q)) {
            prefix_statement.emplace_back(file.text(q), slot);
          }
        }
      }
      // The parts of `self.total` are not names of their own.
      return !qualified;
    }
    return true;
  });

  for (size_t i = 0; i < index.references_.size(); ++i) {
    NameReference & ref = index.references_[i];
    if (ref_statement[i] == k_no_statement) continue;
    ref.statement = &index.statements_[ref_statement[i]];
    index.by_name_[ref.name].push_back(ref.statement);
  }
  for (const auto & [prefix, slot] : prefix_statement) {
    auto & statements = index.by_prefix_[prefix];
    const StatementNode * s = &index.statements_[slot];
    if (std::find(statements.begin(), statements.end(), s) == statements.end()) {
      statements.push_back(s);
    }
  }

  spdlog::debug(
    "indexed '{}': {} statements, {} name occurrences", file.filename(),
    index.statements_.size(), index.references_.size());
  return index;
}

gsl::span<const StatementNode * const> ReferenceIndex::statements_referencing(
  std::string_view name) const
{
  const auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return {};
  }
  return {it->second.data(), it->second.size()};
}

gsl::span<const StatementNode * const> ReferenceIndex::statements_extending(
  std::string_view name) const
{
  const auto it = by_prefix_.find(name);
  if (it == by_prefix_.end()) {
    return {};
  }
  return {it->second.data(), it->second.size()};
}

const StatementNode * ReferenceIndex::find_statement(const ts_ll::Node & node) const
{
  const auto it = statement_by_node_.find(node.id());
  if (it == statement_by_node_.end()) {
    return nullptr;
  }
  return &statements_[it->second];
}

}  // namespace sce
