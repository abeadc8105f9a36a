// sce/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// These helpers parse an in-memory snippet and locate cursor positions by
// searching for text, so tests do not hard-code line/column numbers.
//
#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "sce/analysis/reference_index.hpp"
#include "sce/basic/source_manager.hpp"
#include "sce/syntax/language.hpp"
#include "sce/syntax/source_file.hpp"

namespace sce::test_support
{

/// Byte offset of the `nth` (zero-based) occurrence of `needle`, plus `delta`
[[nodiscard]] inline uint32_t offset_of(
  std::string_view text, std::string_view needle, size_t nth = 0, uint32_t delta = 0)
{
  size_t pos = text.find(needle);
  for (size_t i = 0; i < nth && pos != std::string_view::npos; ++i) {
    pos = text.find(needle, pos + 1);
  }
  if (pos == std::string_view::npos) {
    throw std::invalid_argument("test text does not contain '" + std::string(needle) + "'");
  }
  return static_cast<uint32_t>(pos) + delta;
}

/// Editor position of `needle` (see offset_of)
[[nodiscard]] inline Point point_of(
  std::string_view text, std::string_view needle, size_t nth = 0, uint32_t delta = 0,
  PositionEncoding encoding = PositionEncoding::Utf32)
{
  const SourceManager sm{std::string(text), encoding};
  return sm.get_point(offset_of(text, needle, nth, delta));
}

struct TestParseUnit
{
  std::unique_ptr<SourceFile> file;

  [[nodiscard]] const SourceFile & operator*() const noexcept { return *file; }
  [[nodiscard]] const SourceFile * operator->() const noexcept { return file.get(); }

  [[nodiscard]] std::string_view source() const noexcept
  {
    return file->source().get_source();
  }

  [[nodiscard]] uint32_t offset_of(std::string_view needle, size_t nth = 0, uint32_t delta = 0) const
  {
    return test_support::offset_of(source(), needle, nth, delta);
  }
};

/// Parse `src` with `grammar`; throws when the grammar cannot be loaded.
[[nodiscard]] inline TestParseUnit parse(
  std::string src, GrammarId grammar, std::string filename = "<test>")
{
  auto result = SourceFile::parse(std::move(filename), std::move(src), grammar);
  if (!result) {
    throw std::runtime_error(result.error().describe());
  }
  return TestParseUnit{std::move(result.value())};
}

}  // namespace sce::test_support
