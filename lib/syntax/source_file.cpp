// sce/syntax/source_file.cpp - Parsed source file implementation
#include "sce/syntax/source_file.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sce
{

SourceFile::SourceFile(
  std::string filename, std::string content, const Grammar & grammar, PositionEncoding encoding)
: filename_(std::move(filename)), source_(std::move(content), encoding), grammar_(&grammar)
{
}

Result<std::unique_ptr<SourceFile>> SourceFile::parse(
  std::string filename, std::string content, GrammarId grammar, PositionEncoding encoding)
{
  const Grammar & g = grammar_for(grammar);

  std::unique_ptr<SourceFile> file(
    new SourceFile(std::move(filename), std::move(content), g, encoding));

  ts_ll::Parser parser;
  if (!parser.set_language(g.language())) {
    return make_error(
      ErrorCode::ParseFailure, "grammar '" + std::string(to_string(grammar)) +
                                 "' is not compatible with the tree-sitter runtime");
  }

  file->tree_.reset(parser.parse_string(file->source_.get_source()));
  if (file->tree_.is_null()) {
    return make_error(
      ErrorCode::ParseFailure, "failed to parse '" + file->filename_ + "' as " +
                                 std::string(to_string(grammar)));
  }

  if (file->root().has_error()) {
    spdlog::warn(
      "'{}' has syntax errors; analysis proceeds on the recovered tree", file->filename_);
  }
  spdlog::debug(
    "parsed '{}' as {} ({} bytes)", file->filename_, to_string(grammar), file->source_.size());

  return file;
}

// ============================================================================
// Classification
// ============================================================================

bool SourceFile::is_identifier(const ts_ll::Node & node) const
{
  return !node.is_null() && node.is_named() &&
         contains_kind(grammar_->identifier_kinds, node.kind());
}

ts_ll::Node SourceFile::qualifier(const ts_ll::Node & node) const
{
  if (node.is_null() || !node.is_named() || node.named_child_count() != 2) {
    return {};
  }
  for (const QualifiedName & q : grammar_->qualified_names) {
    if (q.kind != node.kind()) continue;

    const ts_ll::Node object = node.child_by_field(q.object_field);
    const ts_ll::Node member = node.named_child(1);
    if (object.is_null() || member == object || member.child_count() != 0) {
      return {};
    }
    // `this`, `self` and plain identifiers are leaves; `a.b` in `a.b.c` recurses
    const bool object_is_name =
      object.child_count() == 0 ? object.is_named() : is_qualified_name(object);
    return object_is_name ? object : ts_ll::Node();
  }
  return {};
}

bool SourceFile::is_statement(const ts_ll::Node & node) const
{
  if (node.is_null() || !node.is_named()) {
    return false;
  }
  const std::string_view kind = node.kind();
  if (contains_kind(grammar_->statement_kinds, kind)) {
    return true;
  }
  if (grammar_->statement_container_kinds.empty() || is_comment(node)) {
    return false;
  }
  const ts_ll::Node parent = node.parent();
  return !parent.is_null() && contains_kind(grammar_->statement_container_kinds, parent.kind());
}

bool SourceFile::is_block(const ts_ll::Node & node) const
{
  return !node.is_null() && contains_kind(grammar_->block_kinds, node.kind());
}

bool SourceFile::is_comment(const ts_ll::Node & node) const
{
  return !node.is_null() && contains_kind(grammar_->comment_kinds, node.kind());
}

bool SourceFile::is_call_expression(const ts_ll::Node & node) const
{
  return !node.is_null() && node.is_named() && contains_kind(grammar_->call_kinds, node.kind());
}

bool SourceFile::is_function_definition(const ts_ll::Node & node) const
{
  return !node.is_null() && node.is_named() &&
         contains_kind(grammar_->function_kinds, node.kind());
}

bool SourceFile::is_return(const ts_ll::Node & node) const
{
  return !node.is_null() && node.is_named() && contains_kind(grammar_->return_kinds, node.kind());
}

bool SourceFile::is_literal(const ts_ll::Node & node) const
{
  return !node.is_null() && contains_kind(grammar_->literal_kinds, node.kind());
}

bool SourceFile::is_removable_position(const ts_ll::Node & statement) const
{
  const ts_ll::Node parent = statement.parent();
  if (parent.is_null() || parent.parent().is_null()) {
    return true;  // the root itself or a top-level item
  }
  const std::string_view kind = parent.kind();
  return is_block(parent) || contains_kind(grammar_->sequence_kinds, kind) ||
         contains_kind(grammar_->statement_container_kinds, kind);
}

// ============================================================================
// Queries
// ============================================================================

ts_ll::Node SourceFile::enclosing_statement(ts_ll::Node node) const
{
  for (; !node.is_null(); node = node.parent()) {
    if (is_statement(node)) {
      return node;
    }
  }
  return {};
}

ts_ll::Node SourceFile::enclosing_function(ts_ll::Node node) const
{
  for (; !node.is_null(); node = node.parent()) {
    if (is_function_definition(node)) {
      return node;
    }
  }
  return {};
}

ts_ll::Node SourceFile::innermost_at(uint32_t offset, const NodePredicate & pred) const
{
  ts_ll::Node best;
  ts_ll::Node node = root();

  while (!node.is_null()) {
    if (pred(node)) {
      best = node;
    }

    ts_ll::Node next;
    const uint32_t count = node.child_count();
    for (uint32_t i = 0; i < count; ++i) {
      const ts_ll::Node c = node.child(i);
      if (c.range().contains(offset)) {
        next = c;
        break;
      }
    }
    if (next.is_null()) {
      // Cursor right after a node: `sum|)`
      for (uint32_t i = 0; i < count; ++i) {
        const ts_ll::Node c = node.child(i);
        if (c.end_byte() == offset && c.start_byte() < offset) {
          next = c;
        }
      }
    }
    node = next;
  }
  return best;
}

std::string_view SourceFile::line_indent(uint32_t offset) const noexcept
{
  const std::string_view line = source_.get_line(source_.get_line_index(offset));
  size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
    ++n;
  }
  return line.substr(0, n);
}

}  // namespace sce
