// sce/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "sce/syntax/ts_ll.hpp"

#include <cassert>

namespace sce::ts_ll
{

std::vector<Node> Node::children_by_field(std::string_view field) const
{
  std::vector<Node> out;
  Cursor cursor(*this);
  if (!cursor.goto_first_child()) {
    return out;
  }
  do {
    if (cursor.current_field_name() == field) {
      out.push_back(cursor.current_node());
    }
  } while (cursor.goto_next_sibling());
  return out;
}

std::vector<Node> Node::named_children() const
{
  std::vector<Node> out;
  const uint32_t n = named_child_count();
  out.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    out.push_back(named_child(i));
  }
  return out;
}

Parser::Parser()
{
  parser_ = ts_parser_new();
  assert(parser_ && "ts_parser_new() failed");
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

bool Parser::set_language(const TSLanguage * language) noexcept
{
  if (!parser_ || !language) {
    return false;
  }
  return ts_parser_set_language(parser_, language);
}

TSTree * Parser::parse_string(std::string_view source) const
{
  assert(parser_);
  // Tree-sitter consumes bytes; the grammars expect UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace sce::ts_ll
