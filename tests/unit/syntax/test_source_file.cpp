// tests/unit/syntax/test_source_file.cpp - Syntax tree adapter tests
#include <gtest/gtest.h>

#include <string>

#include "sce/syntax/source_file.hpp"
#include "sce/test_support/parse_helpers.hpp"

using namespace sce;
using sce::test_support::parse;

namespace
{

ts_ll::Node statement_at(const SourceFile & file, uint32_t offset)
{
  return file.innermost_at(offset, [&](const ts_ll::Node & n) { return file.is_statement(n); });
}

}  // namespace

TEST(SourceFile, ParsesAndExposesSource)
{
  auto unit = parse("int main() { return 0; }\n", GrammarId::C, "main.c");
  EXPECT_EQ(unit->filename(), "main.c");
  EXPECT_EQ(unit->grammar().id, GrammarId::C);
  EXPECT_EQ(unit->root().kind(), "translation_unit");
  EXPECT_FALSE(unit->root().has_error());
}

TEST(SourceFile, BrokenInputStillYieldsTree)
{
  auto unit = parse("int main( { int x = ; }\n", GrammarId::C);
  EXPECT_FALSE(unit->root().is_null());
  EXPECT_TRUE(unit->root().has_error());
}

TEST(SourceFile, CStatementPredicates)
{
  const std::string src =
    "int main() {\n"
    "  int a = 1;\n"
    "  if (a) a = 2;\n"
    "  return a;\n"
    "}\n";
  auto unit = parse(src, GrammarId::C);
  const SourceFile & file = *unit;

  const ts_ll::Node decl = statement_at(file, unit.offset_of("int a"));
  ASSERT_FALSE(decl.is_null());
  EXPECT_EQ(decl.kind(), "declaration");
  EXPECT_EQ(file.text(decl), "int a = 1;");
  EXPECT_TRUE(file.is_removable_position(decl));

  // The if body is not directly in a block; removing it would break the if.
  const ts_ll::Node nested = statement_at(file, unit.offset_of("a = 2"));
  ASSERT_FALSE(nested.is_null());
  EXPECT_EQ(nested.kind(), "expression_statement");
  EXPECT_FALSE(file.is_removable_position(nested));
  EXPECT_EQ(file.enclosing_statement(nested.parent()).kind(), "if_statement");

  const ts_ll::Node ret = statement_at(file, unit.offset_of("return"));
  EXPECT_TRUE(file.is_return(ret));

  const ts_ll::Node fn = file.enclosing_function(ret);
  ASSERT_FALSE(fn.is_null());
  EXPECT_TRUE(file.is_function_definition(fn));
  EXPECT_TRUE(file.is_block(fn.child_by_field("body")));
}

TEST(SourceFile, IdentifiersAndCalls)
{
  const std::string src = "void f() { g(x, 42); }\n";
  auto unit = parse(src, GrammarId::C);
  const SourceFile & file = *unit;

  const ts_ll::Node x = file.innermost_at(
    unit.offset_of("x,"), [&](const ts_ll::Node & n) { return file.is_identifier(n); });
  ASSERT_FALSE(x.is_null());
  EXPECT_EQ(file.text(x), "x");

  const ts_ll::Node lit = file.innermost_at(
    unit.offset_of("42"), [&](const ts_ll::Node & n) { return file.is_literal(n); });
  ASSERT_FALSE(lit.is_null());
  EXPECT_EQ(file.text(lit), "42");

  const ts_ll::Node call = file.innermost_at(
    unit.offset_of("x,"), [&](const ts_ll::Node & n) { return file.is_call_expression(n); });
  ASSERT_FALSE(call.is_null());
  EXPECT_EQ(file.text(call), "g(x, 42)");
}

TEST(SourceFile, CursorJustPastIdentifierStillFindsIt)
{
  const std::string src = "void f() { g(sum); }\n";
  auto unit = parse(src, GrammarId::C);
  const SourceFile & file = *unit;

  const ts_ll::Node id = file.innermost_at(
    unit.offset_of("sum", 0, 3), [&](const ts_ll::Node & n) { return file.is_identifier(n); });
  ASSERT_FALSE(id.is_null());
  EXPECT_EQ(file.text(id), "sum");
}

TEST(SourceFile, PythonBlocksAndIndent)
{
  const std::string src =
    "def f(a):\n"
    "    b = a + 1\n"
    "    return b\n";
  auto unit = parse(src, GrammarId::Python);
  const SourceFile & file = *unit;

  const ts_ll::Node stmt = statement_at(file, unit.offset_of("b = a"));
  ASSERT_FALSE(stmt.is_null());
  EXPECT_EQ(stmt.kind(), "expression_statement");
  EXPECT_TRUE(file.is_block(stmt.parent()));
  EXPECT_TRUE(file.is_removable_position(stmt));
  EXPECT_EQ(file.line_indent(stmt.start_byte()), "    ");

  const ts_ll::Node fn = file.enclosing_function(stmt);
  ASSERT_FALSE(fn.is_null());
  EXPECT_EQ(fn.kind(), "function_definition");
}

TEST(SourceFile, RubyExpressionsInBodiesAreStatements)
{
  const std::string src =
    "def f(a)\n"
    "  b = a + 1\n"
    "  puts b\n"
    "end\n";
  auto unit = parse(src, GrammarId::Ruby);
  const SourceFile & file = *unit;

  const ts_ll::Node assign = statement_at(file, unit.offset_of("b = a"));
  ASSERT_FALSE(assign.is_null());
  EXPECT_EQ(assign.kind(), "assignment");

  const ts_ll::Node call = statement_at(file, unit.offset_of("puts"));
  ASSERT_FALSE(call.is_null());
  EXPECT_EQ(file.text(call), "puts b");
}

TEST(SourceFile, TextRangeUsesEditorColumns)
{
  const std::string src = "const char *s = \"\xC3\xA9\";\nint y = 1;\n";
  auto unit = parse(src, GrammarId::C);
  const SourceFile & file = *unit;

  const ts_ll::Node first = statement_at(file, unit.offset_of("const"));
  ASSERT_FALSE(first.is_null());
  EXPECT_EQ(file.text_range(first).end, (Point{0, 20}));

  const ts_ll::Node second = statement_at(file, unit.offset_of("int y"));
  ASSERT_FALSE(second.is_null());
  const TextRange r = file.text_range(second);
  EXPECT_EQ(r.start, (Point{1, 0}));
  EXPECT_EQ(r.end, (Point{1, 10}));
}
