// sce/syntax/language.cpp - Language resolution tables
#include "sce/syntax/language.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <utility>

namespace sce
{

namespace
{

std::string lowercase(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

constexpr std::array<std::pair<std::string_view, GrammarId>, 27> k_name_table{{
  {"c", GrammarId::C},
  {"cpp", GrammarId::Cpp},
  {"c++", GrammarId::Cpp},
  {"cplusplus", GrammarId::Cpp},
  {"cuda-cpp", GrammarId::Cpp},
  {"csharp", GrammarId::CSharp},
  {"c#", GrammarId::CSharp},
  {"cs", GrammarId::CSharp},
  {"c_sharp", GrammarId::CSharp},
  {"go", GrammarId::Go},
  {"golang", GrammarId::Go},
  {"java", GrammarId::Java},
  {"javascript", GrammarId::JavaScript},
  {"js", GrammarId::JavaScript},
  {"javascriptreact", GrammarId::JavaScript},
  {"jsx", GrammarId::JavaScript},
  {"python", GrammarId::Python},
  {"py", GrammarId::Python},
  {"ruby", GrammarId::Ruby},
  {"rb", GrammarId::Ruby},
  {"rust", GrammarId::Rust},
  {"rs", GrammarId::Rust},
  {"typescript", GrammarId::TypeScript},
  {"ts", GrammarId::TypeScript},
  {"typescriptreact", GrammarId::Tsx},
  {"tsx", GrammarId::Tsx},
  {"typescript-tsx", GrammarId::Tsx},
}};

constexpr std::array<std::pair<std::string_view, GrammarId>, 30> k_extension_table{{
  {".c", GrammarId::C},
  {".h", GrammarId::C},
  {".cc", GrammarId::Cpp},
  {".cpp", GrammarId::Cpp},
  {".cxx", GrammarId::Cpp},
  {".c++", GrammarId::Cpp},
  {".hh", GrammarId::Cpp},
  {".hpp", GrammarId::Cpp},
  {".hxx", GrammarId::Cpp},
  {".h++", GrammarId::Cpp},
  {".ipp", GrammarId::Cpp},
  {".cs", GrammarId::CSharp},
  {".go", GrammarId::Go},
  {".java", GrammarId::Java},
  {".js", GrammarId::JavaScript},
  {".mjs", GrammarId::JavaScript},
  {".cjs", GrammarId::JavaScript},
  {".jsx", GrammarId::JavaScript},
  {".py", GrammarId::Python},
  {".pyi", GrammarId::Python},
  {".pyw", GrammarId::Python},
  {".rb", GrammarId::Ruby},
  {".rake", GrammarId::Ruby},
  {".gemspec", GrammarId::Ruby},
  {".rs", GrammarId::Rust},
  {".ts", GrammarId::TypeScript},
  {".mts", GrammarId::TypeScript},
  {".cts", GrammarId::TypeScript},
  {".tsx", GrammarId::Tsx},
  {".ru", GrammarId::Ruby},
}};

std::optional<GrammarId> grammar_from_file_name(std::string_view file_name)
{
  if (file_name == "Rakefile" || file_name == "Gemfile" || file_name == "Guardfile") {
    return GrammarId::Ruby;
  }
  return std::nullopt;
}

// "#!/usr/bin/env python3" -> Python
std::optional<GrammarId> grammar_from_shebang(std::string_view content)
{
  if (content.substr(0, 2) != "#!") {
    return std::nullopt;
  }
  std::string_view line = content.substr(0, content.find('\n'));

  // Interpreter is the last path component of the first word, or the word
  // after `env`.
  std::vector<std::string_view> words;
  size_t i = 2;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    const size_t start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i > start) words.push_back(line.substr(start, i - start));
  }
  if (words.empty()) {
    return std::nullopt;
  }

  std::string_view interpreter = words[0];
  if (const auto slash = interpreter.rfind('/'); slash != std::string_view::npos) {
    interpreter = interpreter.substr(slash + 1);
  }
  if (interpreter == "env" && words.size() > 1) {
    interpreter = words[1];
  }

  if (interpreter.substr(0, 6) == "python") return GrammarId::Python;
  if (interpreter.substr(0, 4) == "ruby") return GrammarId::Ruby;
  if (interpreter == "node" || interpreter == "nodejs") return GrammarId::JavaScript;
  return std::nullopt;
}

}  // namespace

std::string_view to_string(GrammarId id) noexcept
{
  switch (id) {
    case GrammarId::C:
      return "c";
    case GrammarId::Cpp:
      return "cpp";
    case GrammarId::CSharp:
      return "csharp";
    case GrammarId::Go:
      return "go";
    case GrammarId::Java:
      return "java";
    case GrammarId::JavaScript:
      return "javascript";
    case GrammarId::Python:
      return "python";
    case GrammarId::Ruby:
      return "ruby";
    case GrammarId::Rust:
      return "rust";
    case GrammarId::TypeScript:
      return "typescript";
    case GrammarId::Tsx:
      return "tsx";
  }
  return "unknown";
}

const std::vector<GrammarId> & all_grammars()
{
  static const std::vector<GrammarId> k_all = {
    GrammarId::C,    GrammarId::Cpp,        GrammarId::CSharp, GrammarId::Go,
    GrammarId::Java, GrammarId::JavaScript, GrammarId::Python, GrammarId::Ruby,
    GrammarId::Rust, GrammarId::TypeScript, GrammarId::Tsx,
  };
  return k_all;
}

std::optional<GrammarId> grammar_from_name(std::string_view name)
{
  const std::string key = lowercase(name);
  for (const auto & [alias, id] : k_name_table) {
    if (alias == key) return id;
  }
  return std::nullopt;
}

std::optional<GrammarId> grammar_from_extension(std::string_view extension)
{
  const std::string key = lowercase(extension);
  for (const auto & [ext, id] : k_extension_table) {
    if (ext == key) return id;
  }
  return std::nullopt;
}

Result<GrammarId> resolve_language(
  std::string_view filename, std::string_view language_hint, std::string_view content,
  const ExtensionOverrides & overrides)
{
  if (!language_hint.empty()) {
    if (auto id = grammar_from_name(language_hint)) {
      return *id;
    }
  }

  const std::filesystem::path path{std::string(filename)};
  const std::string extension = lowercase(path.extension().string());

  if (!extension.empty()) {
    if (const auto it = overrides.find(extension); it != overrides.end()) {
      if (auto id = grammar_from_name(it->second)) {
        return *id;
      }
    }
    if (auto id = grammar_from_extension(extension)) {
      return *id;
    }
  }

  if (auto id = grammar_from_file_name(path.filename().string())) {
    return *id;
  }

  if (auto id = grammar_from_shebang(content)) {
    return *id;
  }

  std::string msg = "unsupported language for file '" + std::string(filename) + "'";
  if (!language_hint.empty()) {
    msg += " (language hint '" + std::string(language_hint) + "')";
  }
  return make_error(ErrorCode::Unsupported, std::move(msg));
}

}  // namespace sce
