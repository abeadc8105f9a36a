// tests/unit/edit/test_text_edit.cpp - Range merging and text rewriting tests
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sce/edit/text_edit.hpp"

using namespace sce;

namespace
{

TextRange range(uint32_t l0, uint32_t c0, uint32_t l1, uint32_t c1)
{
  return TextRange{Point{l0, c0}, Point{l1, c1}};
}

const char * const k_program =
  "int main() {\n"
  "  int a = 1;\n"
  "  int b = 2;\n"
  "  return a;\n"
  "}\n";

}  // namespace

TEST(MergeSourceRanges, WhitespaceGaps)
{
  const std::string src = "aa  bb\ncc x";
  const std::vector<SourceRange> input{{7, 9}, {0, 2}, {4, 6}};

  const auto joined = merge_source_ranges(src, input, /*merge_whitespace_gaps=*/true);
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(joined[0], SourceRange(0, 9));

  const auto kept_apart = merge_source_ranges(src, input, /*merge_whitespace_gaps=*/false);
  ASSERT_EQ(kept_apart.size(), 3u);
  EXPECT_EQ(kept_apart[0], SourceRange(0, 2));
  EXPECT_EQ(kept_apart[2], SourceRange(7, 9));
}

TEST(MergeSourceRanges, TextInGapKeepsRangesApart)
{
  const std::string src = "aa x bb";
  const auto merged = merge_source_ranges(src, {{0, 2}, {5, 7}}, true);
  EXPECT_EQ(merged.size(), 2u);
}

TEST(ApplyReplacements, RewritesInOrder)
{
  const std::string out = apply_replacements(
    "hello world", {{SourceRange(6, 11), "all"}, {SourceRange(0, 5), "bye"}});
  EXPECT_EQ(out, "bye all");
}

TEST(ApplyReplacements, SkipsOverlappingEdit)
{
  const std::string out =
    apply_replacements("hello world", {{SourceRange(0, 5), "X"}, {SourceRange(3, 8), "Y"}});
  EXPECT_EQ(out, "X world");
}

TEST(ApplyReplacements, InsertionAtEnd)
{
  EXPECT_EQ(apply_replacements("abc", {{SourceRange(3, 3), "!"}}), "abc!");
  EXPECT_EQ(apply_replacements("abc", {}), "abc");
}

TEST(ApplyRemovals, DropsEmptiedLinesAndMovesCursor)
{
  const SourceManager sm(k_program);
  const std::vector<TextRange> ranges{range(2, 2, 2, 12)};

  const RemovalResult result = apply_removals(sm, ranges, Point{3, 9});
  EXPECT_EQ(
    result.content,
    "int main() {\n"
    "  int a = 1;\n"
    "  return a;\n"
    "}\n");
  EXPECT_EQ(result.cursor, (Point{2, 9}));
}

TEST(ApplyRemovals, CursorOnRemovedLineGoesToNextLine)
{
  const SourceManager sm(k_program);
  const std::vector<TextRange> ranges{range(1, 2, 2, 12)};

  const RemovalResult result = apply_removals(sm, ranges, Point{2, 5});
  EXPECT_EQ(
    result.content,
    "int main() {\n"
    "  return a;\n"
    "}\n");
  EXPECT_EQ(result.cursor, (Point{1, 0}));
}

TEST(ApplyRemovals, PartialLineKeepsRest)
{
  const SourceManager sm("a; b; c;\n");
  const std::vector<TextRange> ranges{range(0, 3, 0, 5)};

  const RemovalResult result = apply_removals(sm, ranges, Point{0, 6});
  EXPECT_EQ(result.content, "a;  c;\n");
  EXPECT_EQ(result.cursor, (Point{0, 4}));
}

TEST(ApplyRemovals, NoRangesIsIdentity)
{
  const SourceManager sm(k_program);
  const RemovalResult result = apply_removals(sm, {}, Point{1, 3});
  EXPECT_EQ(result.content, k_program);
  EXPECT_EQ(result.cursor, (Point{1, 3}));
}

TEST(ApplyRemovals, ColumnsFollowEncoding)
{
  // "é" is one UTF-16 unit and two bytes.
  const std::string text = "x = 1; s = \"\xC3\xA9\"; y\n";
  const SourceManager utf16(text, PositionEncoding::Utf16);
  const std::vector<TextRange> ranges{range(0, 0, 0, 6)};

  const RemovalResult result = apply_removals(utf16, ranges, Point{0, 16});
  EXPECT_EQ(result.content, " s = \"\xC3\xA9\"; y\n");
  EXPECT_EQ(result.cursor, (Point{0, 10}));
}
