// sce/transform/inliner.hpp - Call-site inlining of a function definition
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sce/basic/error.hpp"
#include "sce/syntax/source_file.hpp"
#include "sce/syntax/ts_ll.hpp"

namespace sce
{

struct InlineOptions
{
  /// Bind non-trivial arguments to temporaries instead of substituting text
  bool hoist_complex_arguments = false;
  std::string temp_prefix = "inline_";
};

/**
 * A parameter of the target definition.
 *
 * `declaration` is the whole parameter node (`int n`), `name` its bound
 * identifier.
 */
struct Parameter
{
  std::string_view name;
  ts_ll::Node declaration;
  ts_ll::Node name_node;
};

struct FunctionDefinition
{
  ts_ll::Node node;
  std::string_view name;  ///< empty for anonymous functions
  std::vector<Parameter> parameters;
  ts_ll::Node body;
};

/**
 * An argument at the call site. `keyword` is set for `name=value`
 * arguments; `value` is the argument expression.
 */
struct Argument
{
  std::string_view keyword;
  ts_ll::Node value;
};

struct CallSite
{
  ts_ll::Node call;
  std::vector<Argument> arguments;
  /// Innermost statement holding the call; null when the call is outside any
  ts_ll::Node statement;
  /// The statement is the call alone (`f(x);`), its value is discarded
  bool standalone = false;
};

/**
 * Replaces one call expression with a parameter-substituted copy of a
 * function body. The call file and the target file may be the same file.
 */
class Inliner
{
public:
  Inliner(const SourceFile & call_file, const SourceFile & target_file, InlineOptions options = {})
  : call_file_(call_file), target_file_(target_file), options_(std::move(options))
  {
  }

  /// Innermost call expression at `offset` of the call file
  [[nodiscard]] Result<CallSite> find_call(uint32_t offset) const;

  /// Innermost function definition at `offset` of the target file
  [[nodiscard]] Result<FunctionDefinition> find_definition(uint32_t offset) const;

  /**
   * Inline the definition at `target_offset` into the call at `call_offset`.
   *
   * @return the complete new content of the call file
   */
  [[nodiscard]] Result<std::string> inline_call(uint32_t call_offset, uint32_t target_offset) const;

private:
  const SourceFile & call_file_;
  const SourceFile & target_file_;
  InlineOptions options_;
};

}  // namespace sce
