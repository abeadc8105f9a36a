// tests/unit/analysis/test_reference_index.cpp - Reference model tests
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "sce/analysis/reference_index.hpp"
#include "sce/test_support/parse_helpers.hpp"

using namespace sce;
using sce::test_support::parse;

namespace
{

bool has_name(const std::vector<std::string_view> & names, std::string_view name)
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

const StatementNode * statement_with_text(
  const SourceFile & file, const ReferenceIndex & index, std::string_view text)
{
  for (const StatementNode & s : index.statements()) {
    if (file.text(s.node) == text) return &s;
  }
  return nullptr;
}

}  // namespace

TEST(ReferenceIndex, RecordsStatementsInSourceOrder)
{
  const std::string src =
    "int main() {\n"
    "  int a = 1;\n"
    "  int b = a + 2;\n"
    "  return b;\n"
    "}\n";
  auto unit = parse(src, GrammarId::C);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  // compound_statement, two declarations, return
  ASSERT_EQ(index.statements().size(), 4u);
  for (size_t i = 1; i < index.statements().size(); ++i) {
    EXPECT_LE(index.statements()[i - 1].range.begin(), index.statements()[i].range.begin());
  }
  for (size_t i = 1; i < index.references().size(); ++i) {
    EXPECT_LT(index.references()[i - 1].range.begin(), index.references()[i].range.begin());
  }
}

TEST(ReferenceIndex, SeparatesDefinitionsFromUses)
{
  const std::string src =
    "void f(void) {\n"
    "  int x = y;\n"
    "  z = x + 1;\n"
    "}\n";
  auto unit = parse(src, GrammarId::C);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  const StatementNode * decl = statement_with_text(*unit, index, "int x = y;");
  ASSERT_NE(decl, nullptr);
  EXPECT_TRUE(has_name(decl->definitions, "x"));
  EXPECT_FALSE(has_name(decl->definitions, "y"));
  EXPECT_TRUE(has_name(decl->references, "x"));
  EXPECT_TRUE(has_name(decl->references, "y"));

  const StatementNode * assign = statement_with_text(*unit, index, "z = x + 1;");
  ASSERT_NE(assign, nullptr);
  EXPECT_TRUE(has_name(assign->definitions, "z"));
  EXPECT_FALSE(has_name(assign->definitions, "x"));
}

TEST(ReferenceIndex, IdentifiersAttachToInnermostStatement)
{
  const std::string src =
    "void f(void) {\n"
    "  for (i = 0; i < n; ++i) {\n"
    "    s = s + i;\n"
    "  }\n"
    "}\n";
  auto unit = parse(src, GrammarId::C);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  const StatementNode * body = statement_with_text(*unit, index, "s = s + i;");
  ASSERT_NE(body, nullptr);

  for (const NameReference & ref : index.references()) {
    if (ref.name == "s") {
      EXPECT_EQ(ref.statement, body);
    }
    if (ref.name == "n") {
      ASSERT_NE(ref.statement, nullptr);
      EXPECT_EQ(ref.statement->node.kind(), "for_statement");
    }
  }
}

TEST(ReferenceIndex, LookupByNameIsScopeUnaware)
{
  const std::string src =
    "void f(void) { int v = 1; }\n"
    "void g(void) { v = 2; }\n";
  auto unit = parse(src, GrammarId::C);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  const auto users = index.statements_referencing("v");
  ASSERT_EQ(users.size(), 2u);
  EXPECT_EQ(unit->text(users[0]->node), "int v = 1;");
  EXPECT_EQ(unit->text(users[1]->node), "v = 2;");

  EXPECT_TRUE(index.statements_referencing("missing").empty());
}

TEST(ReferenceIndex, FindStatementByNode)
{
  const std::string src = "x = 1\ny = x\n";
  auto unit = parse(src, GrammarId::Python);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  ASSERT_EQ(index.statements().size(), 2u);
  const StatementNode & second = index.statements()[1];
  EXPECT_EQ(index.find_statement(second.node), &second);
  EXPECT_EQ(index.find_statement(unit->root()), nullptr);
  EXPECT_TRUE(has_name(second.definitions, "y"));
  EXPECT_TRUE(has_name(second.references, "x"));
}

TEST(ReferenceIndex, PythonParametersAreDefinitions)
{
  const std::string src =
    "def scale(v, k):\n"
    "    return v * k\n";
  auto unit = parse(src, GrammarId::Python);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  size_t parameter_defs = 0;
  for (const NameReference & ref : index.references()) {
    if (ref.is_definition && (ref.name == "v" || ref.name == "k")) {
      ++parameter_defs;
    }
  }
  EXPECT_EQ(parameter_defs, 2u);
}

TEST(ReferenceIndex, QualifiedNamesAreSingleNames)
{
  const std::string src =
    "class Tally:\n"
    "    def add(self, v):\n"
    "        self.total = v\n"
    "        self.items.append(self.total)\n";
  auto unit = parse(src, GrammarId::Python);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  const StatementNode * assign = statement_with_text(*unit, index, "self.total = v");
  ASSERT_NE(assign, nullptr);
  EXPECT_TRUE(has_name(assign->definitions, "self.total"));
  EXPECT_TRUE(has_name(assign->references, "v"));
  EXPECT_FALSE(has_name(assign->references, "self"));
  EXPECT_FALSE(has_name(assign->references, "total"));

  const StatementNode * append =
    statement_with_text(*unit, index, "self.items.append(self.total)");
  ASSERT_NE(append, nullptr);
  EXPECT_TRUE(has_name(append->references, "self.items.append"));
  EXPECT_TRUE(has_name(append->references, "self.total"));
  EXPECT_TRUE(append->definitions.empty());

  const auto extending = index.statements_extending("self.items");
  ASSERT_EQ(extending.size(), 1u);
  EXPECT_EQ(extending[0], append);

  // A receiver prefixes everything in the class; it is never extended.
  EXPECT_TRUE(index.statements_extending("self").empty());
  EXPECT_TRUE(index.statements_extending("self.total").empty());
}

TEST(ReferenceIndex, MethodCallsExtendTheirObject)
{
  const std::string src =
    "xs = []\n"
    "xs.append(1)\n";
  auto unit = parse(src, GrammarId::Python);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  EXPECT_EQ(index.statements_referencing("xs").size(), 1u);
  const auto extending = index.statements_extending("xs");
  ASSERT_EQ(extending.size(), 1u);
  EXPECT_EQ(unit->text(extending[0]->node), "xs.append(1)");
}

TEST(ReferenceIndex, CFieldAccessThroughPointer)
{
  const std::string src =
    "void f(struct P *p) {\n"
    "  p->x = 1;\n"
    "  int y = p->y;\n"
    "}\n";
  auto unit = parse(src, GrammarId::C);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  const StatementNode * store = statement_with_text(*unit, index, "p->x = 1;");
  ASSERT_NE(store, nullptr);
  EXPECT_TRUE(has_name(store->definitions, "p->x"));
  EXPECT_FALSE(has_name(store->references, "p"));

  const StatementNode * load = statement_with_text(*unit, index, "int y = p->y;");
  ASSERT_NE(load, nullptr);
  EXPECT_TRUE(has_name(load->references, "p->y"));
  EXPECT_FALSE(has_name(load->definitions, "p->y"));
}

TEST(ReferenceIndex, RubyBareNameStatementIsAUse)
{
  const std::string src =
    "def f\n"
    "  total = 0\n"
    "  total\n"
    "end\n";
  auto unit = parse(src, GrammarId::Ruby);
  const ReferenceIndex index = ReferenceIndex::build(*unit);

  const NameReference * tail = nullptr;
  for (const NameReference & ref : index.references()) {
    if (ref.name == "total") tail = &ref;
  }
  ASSERT_NE(tail, nullptr);
  ASSERT_NE(tail->statement, nullptr);
  EXPECT_TRUE(tail->statement->node == tail->node);
  EXPECT_FALSE(tail->is_definition);
  EXPECT_TRUE(has_name(tail->statement->references, "total"));
  EXPECT_TRUE(tail->statement->definitions.empty());
}
