// tests/unit/syntax/test_language.cpp - Language resolution tests
#include <gtest/gtest.h>

#include "sce/syntax/grammar.hpp"
#include "sce/syntax/language.hpp"

using namespace sce;

TEST(LanguageResolver, EditorHintWins)
{
  auto id = resolve_language("script.txt", "python");
  ASSERT_TRUE(id) << id.error().describe();
  EXPECT_EQ(id.value(), GrammarId::Python);

  // Hint beats the extension.
  id = resolve_language("main.c", "cpp");
  ASSERT_TRUE(id);
  EXPECT_EQ(id.value(), GrammarId::Cpp);
}

TEST(LanguageResolver, EditorLanguageIdAliases)
{
  EXPECT_EQ(resolve_language("a", "typescriptreact").value(), GrammarId::Tsx);
  EXPECT_EQ(resolve_language("a", "CSharp").value(), GrammarId::CSharp);
  EXPECT_EQ(resolve_language("a", "golang").value(), GrammarId::Go);
}

TEST(LanguageResolver, UnknownHintFallsBackToExtension)
{
  auto id = resolve_language("lib.rs", "plaintext");
  ASSERT_TRUE(id);
  EXPECT_EQ(id.value(), GrammarId::Rust);
}

TEST(LanguageResolver, Extensions)
{
  EXPECT_EQ(resolve_language("x.java", "").value(), GrammarId::Java);
  EXPECT_EQ(resolve_language("dir/x.TS", "").value(), GrammarId::TypeScript);
  EXPECT_EQ(resolve_language("x.tsx", "").value(), GrammarId::Tsx);
  EXPECT_EQ(resolve_language("x.hpp", "").value(), GrammarId::Cpp);
  EXPECT_EQ(resolve_language("x.rb", "").value(), GrammarId::Ruby);
  EXPECT_EQ(resolve_language("Rakefile", "").value(), GrammarId::Ruby);
}

TEST(LanguageResolver, OverridesApplyBeforeBuiltinTable)
{
  const ExtensionOverrides overrides{{".h", "cpp"}};
  auto id = resolve_language("widget.h", "", "", overrides);
  ASSERT_TRUE(id);
  EXPECT_EQ(id.value(), GrammarId::Cpp);

  EXPECT_EQ(resolve_language("widget.h", "").value(), GrammarId::C);
}

TEST(LanguageResolver, Shebang)
{
  auto id = resolve_language("tool", "", "#!/usr/bin/env python3\nprint(1)\n");
  ASSERT_TRUE(id);
  EXPECT_EQ(id.value(), GrammarId::Python);

  id = resolve_language("tool", "", "#!/usr/bin/ruby -w\nputs 1\n");
  ASSERT_TRUE(id);
  EXPECT_EQ(id.value(), GrammarId::Ruby);
}

TEST(LanguageResolver, UnsupportedIsReported)
{
  auto id = resolve_language("notes.md", "markdown");
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error().code, ErrorCode::Unsupported);
  EXPECT_NE(id.error().message.find("notes.md"), std::string::npos);
  EXPECT_NE(id.error().message.find("markdown"), std::string::npos);

  EXPECT_FALSE(resolve_language("Makefile", ""));
}

TEST(LanguageResolver, EveryGrammarHasCapabilityTable)
{
  for (const GrammarId id : all_grammars()) {
    const Grammar & g = grammar_for(id);
    EXPECT_EQ(g.id, id) << to_string(id);
    EXPECT_NE(g.language, nullptr) << to_string(id);
    EXPECT_FALSE(g.identifier_kinds.empty()) << to_string(id);
    EXPECT_FALSE(g.call_kinds.empty()) << to_string(id);
    EXPECT_FALSE(g.function_kinds.empty()) << to_string(id);
    EXPECT_EQ(grammar_from_name(to_string(id)), id);
  }
}
