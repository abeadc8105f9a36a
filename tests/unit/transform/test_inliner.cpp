// tests/unit/transform/test_inliner.cpp - Call-site inlining tests
#include <gtest/gtest.h>

#include <string>

#include "sce/test_support/parse_helpers.hpp"
#include "sce/transform/inliner.hpp"

using namespace sce;
using sce::test_support::parse;

namespace
{

/// Inline within one file: call at `call_text`, definition at `def_text`.
Result<std::string> inline_in_file(
  const std::string & src, GrammarId grammar, std::string_view call_text,
  std::string_view def_text, InlineOptions options = {})
{
  auto unit = parse(src, grammar);
  const Inliner inliner(*unit, *unit, std::move(options));
  return inliner.inline_call(unit.offset_of(call_text), unit.offset_of(def_text));
}

const char * const k_log_twice =
  "#include <stdio.h>\n"
  "\n"
  "void log_twice(int v) {\n"
  "  printf(\"%d\\n\", v);\n"
  "  printf(\"%d\\n\", v);\n"
  "}\n"
  "\n"
  "int main() {\n"
  "  int a = 41;\n"
  "  log_twice(a + 1);\n"
  "  return 0;\n"
  "}\n";

}  // namespace

TEST(Inliner, ReturnExpressionReplacesCall)
{
  const std::string src =
    "int to_inline(int a, int b) {\n"
    "  return a + b;\n"
    "}\n"
    "\n"
    "int main() {\n"
    "  int x = to_inline(1, 2);\n"
    "  return x;\n"
    "}\n";
  auto out = inline_in_file(src, GrammarId::C, "to_inline(1", "to_inline(int");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_EQ(
    out.value(),
    "int to_inline(int a, int b) {\n"
    "  return a + b;\n"
    "}\n"
    "\n"
    "int main() {\n"
    "  int x = 1 + 2;\n"
    "  return x;\n"
    "}\n");
}

TEST(Inliner, CompoundValueIsParenthesizedInsideAnOperator)
{
  const std::string src =
    "int add(int a, int b) { return a + b; }\n"
    "int pick(int a) { return a; }\n"
    "int main() {\n"
    "  int y = 2 * add(1, 2);\n"
    "  int z = 2 * pick(y);\n"
    "  return -add(y, z);\n"
    "}\n";

  auto product = inline_in_file(src, GrammarId::C, "add(1", "add(int");
  ASSERT_TRUE(product) << product.error().describe();
  EXPECT_NE(product.value().find("  int y = 2 * (1 + 2);\n"), std::string::npos);

  auto negated = inline_in_file(src, GrammarId::C, "add(y", "add(int");
  ASSERT_TRUE(negated) << negated.error().describe();
  EXPECT_NE(negated.value().find("  return -(y + z);\n"), std::string::npos);

  // A lone name needs no parentheses.
  auto name = inline_in_file(src, GrammarId::C, "pick(y", "pick(int");
  ASSERT_TRUE(name) << name.error().describe();
  EXPECT_NE(name.value().find("  int z = 2 * y;\n"), std::string::npos);
}

TEST(Inliner, PythonOperandGetsParentheses)
{
  const std::string src =
    "def double(v):\n"
    "    return v + v\n"
    "\n"
    "r = double(4) * 3\n";
  auto out = inline_in_file(src, GrammarId::Python, "double(4", "def double");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_NE(out.value().find("r = (4 + 4) * 3\n"), std::string::npos);
}

TEST(Inliner, DefinitionFromAnotherDocument)
{
  auto call = parse("int main() {\n  int x = add(y, 3);\n}\n", GrammarId::C);
  auto target = parse("int add(int p, int q) { return p + q; }\n", GrammarId::C);

  const Inliner inliner(*call, *target);
  auto out = inliner.inline_call(call.offset_of("add"), target.offset_of("add"));
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_EQ(out.value(), "int main() {\n  int x = y + 3;\n}\n");
}

TEST(Inliner, ArityMismatch)
{
  const std::string src =
    "int add(int a, int b) { return a + b; }\n"
    "int main() { int x = add(1); }\n";
  auto out = inline_in_file(src, GrammarId::C, "add(1", "add(int");
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().code, ErrorCode::ArityMismatch);
  EXPECT_EQ(out.error().message, "'add' takes 2 parameter(s) but the call passes 1 argument(s)");
}

TEST(Inliner, StandaloneCallSplicesBody)
{
  const std::string src = k_log_twice;
  auto out = inline_in_file(src, GrammarId::C, "log_twice(a", "log_twice(int");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_EQ(
    out.value(),
    "#include <stdio.h>\n"
    "\n"
    "void log_twice(int v) {\n"
    "  printf(\"%d\\n\", v);\n"
    "  printf(\"%d\\n\", v);\n"
    "}\n"
    "\n"
    "int main() {\n"
    "  int a = 41;\n"
    "  printf(\"%d\\n\", a + 1);\n"
    "  printf(\"%d\\n\", a + 1);\n"
    "  return 0;\n"
    "}\n");
}

TEST(Inliner, ValueUseOfVoidFunctionFails)
{
  std::string src = k_log_twice;
  src.replace(src.find("  log_twice(a + 1);"), 19, "  int z = log_twice(a);");
  auto out = inline_in_file(src, GrammarId::C, "log_twice(a", "log_twice(int");
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().code, ErrorCode::MissingReturnValue);
}

TEST(Inliner, NoCallAtPoint)
{
  const std::string src = k_log_twice;
  auto out = inline_in_file(src, GrammarId::C, "int a", "log_twice(int");
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().code, ErrorCode::CallNotFound);
}

TEST(Inliner, NoDefinitionAtTarget)
{
  const std::string src = k_log_twice;
  auto out = inline_in_file(src, GrammarId::C, "log_twice(a", "#include");
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().code, ErrorCode::TargetUnresolvable);
}

TEST(Inliner, HoistsComplexArgumentsWhenEnabled)
{
  const std::string src =
    "int square(int v) {\n"
    "  return v * v;\n"
    "}\n"
    "\n"
    "int main() {\n"
    "  int y = square(compute(2));\n"
    "  return y;\n"
    "}\n";

  auto verbatim = inline_in_file(src, GrammarId::C, "square(compute", "square(int");
  ASSERT_TRUE(verbatim) << verbatim.error().describe();
  EXPECT_NE(verbatim.value().find("  int y = compute(2) * compute(2);\n"), std::string::npos);

  InlineOptions options;
  options.hoist_complex_arguments = true;
  auto hoisted = inline_in_file(src, GrammarId::C, "square(compute", "square(int", options);
  ASSERT_TRUE(hoisted) << hoisted.error().describe();
  EXPECT_NE(
    hoisted.value().find(
      "int main() {\n"
      "  int inline_v = compute(2);\n"
      "  int y = inline_v * inline_v;\n"
      "  return y;\n"
      "}\n"),
    std::string::npos);
}

TEST(Inliner, TrivialArgumentsAreNeverHoisted)
{
  const std::string src =
    "int square(int v) { return v * v; }\n"
    "int main() { int n = 3; int y = square(n); }\n";
  InlineOptions options;
  options.hoist_complex_arguments = true;
  auto out = inline_in_file(src, GrammarId::C, "square(n", "square(int", options);
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_NE(out.value().find("int y = n * n;"), std::string::npos);
  EXPECT_EQ(out.value().find("inline_"), std::string::npos);
}

// ============================================================================
// Other languages
// ============================================================================

TEST(Inliner, PythonMultiStatementBody)
{
  const std::string src =
    "def add_four(x):\n"
    "    total = x + 4\n"
    "    return total\n"
    "\n"
    "\n"
    "r = add_four(y)\n"
    "print(r)\n";
  auto out = inline_in_file(src, GrammarId::Python, "add_four(y", "def add_four");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_EQ(
    out.value(),
    "def add_four(x):\n"
    "    total = x + 4\n"
    "    return total\n"
    "\n"
    "\n"
    "total = y + 4\n"
    "r = total\n"
    "print(r)\n");
}

TEST(Inliner, PythonKeywordArguments)
{
  const std::string src =
    "def scale(value, factor):\n"
    "    return value * factor\n"
    "\n"
    "r = scale(factor=3, value=n)\n";
  auto out = inline_in_file(src, GrammarId::Python, "scale(factor", "def scale");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_NE(out.value().find("r = n * 3\n"), std::string::npos);

  const std::string unknown =
    "def scale(value, factor):\n"
    "    return value * factor\n"
    "\n"
    "r = scale(factor=3, size=n)\n";
  auto bad = inline_in_file(unknown, GrammarId::Python, "scale(factor", "def scale");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::ArityMismatch);
}

TEST(Inliner, RustTailExpressionIsTheValue)
{
  const std::string src =
    "fn add(a: i32, b: i32) -> i32 {\n"
    "    a + b\n"
    "}\n"
    "\n"
    "fn main() {\n"
    "    let x = add(1, 2);\n"
    "}\n";
  auto out = inline_in_file(src, GrammarId::Rust, "add(1", "fn add");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_NE(out.value().find("    let x = 1 + 2;\n"), std::string::npos);
}

TEST(Inliner, JavaScriptArrowExpressionBody)
{
  const std::string src =
    "const twice = (n) => n * 2;\n"
    "const y = twice(5);\n";
  auto out = inline_in_file(src, GrammarId::JavaScript, "twice(5", "(n) =>");
  ASSERT_TRUE(out) << out.error().describe();
  EXPECT_EQ(out.value(), "const twice = (n) => n * 2;\nconst y = 5 * 2;\n");
}

TEST(Inliner, GoGroupedParameters)
{
  auto unit = parse(
    "package main\n"
    "\n"
    "func add(a, b int) int {\n"
    "\treturn a + b\n"
    "}\n",
    GrammarId::Go);
  const Inliner inliner(*unit, *unit);

  auto def = inliner.find_definition(unit.offset_of("add"));
  ASSERT_TRUE(def) << def.error().describe();
  EXPECT_EQ(def->name, "add");
  ASSERT_EQ(def->parameters.size(), 2u);
  EXPECT_EQ(def->parameters[0].name, "a");
  EXPECT_EQ(def->parameters[1].name, "b");
}
