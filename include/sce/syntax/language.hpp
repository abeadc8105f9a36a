// sce/syntax/language.hpp - Language resolution (filename/hint -> grammar)
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sce/basic/error.hpp"

namespace sce
{

/**
 * Grammars compiled into the engine.
 */
enum class GrammarId : uint8_t {
  C,
  Cpp,
  CSharp,
  Go,
  Java,
  JavaScript,
  Python,
  Ruby,
  Rust,
  TypeScript,
  Tsx,
};

/// Canonical lower-case name ("c", "cpp", "csharp", ...)
[[nodiscard]] std::string_view to_string(GrammarId id) noexcept;

[[nodiscard]] const std::vector<GrammarId> & all_grammars();

/// Map an editor language id / alias to a grammar (case-insensitive)
[[nodiscard]] std::optional<GrammarId> grammar_from_name(std::string_view name);

/// Map a file extension (with leading dot, case-insensitive) to a grammar
[[nodiscard]] std::optional<GrammarId> grammar_from_extension(std::string_view extension);

/// Extension (".h") -> language name ("cpp") overrides, checked before the static table
using ExtensionOverrides = std::unordered_map<std::string, std::string>;

/**
 * Resolve the grammar for a request.
 *
 * Order: language hint, extension overrides, static extension/file-name
 * table, then a `#!` line in the content.
 *
 * @return GrammarId, or an Unsupported error naming the file and hint
 */
[[nodiscard]] Result<GrammarId> resolve_language(
  std::string_view filename, std::string_view language_hint, std::string_view content = {},
  const ExtensionOverrides & overrides = {});

}  // namespace sce
