// sce/transform/inliner.cpp - Call-site inlining of a function definition
#include "sce/transform/inliner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <unordered_map>

#include "sce/edit/text_edit.hpp"

namespace sce
{

namespace
{

std::string_view trim_right(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

bool is_blank(std::string_view s)
{
  return trim_right(s).empty();
}

std::string describe_point(const SourceFile & file, uint32_t offset)
{
  const Point p = file.source().get_point(offset);
  return "line " + std::to_string(p.line) + ", column " + std::to_string(p.column);
}

/// Whether an anonymous `token` of an expression binds tighter than a spliced value
bool is_operator_token(std::string_view token)
{
  if (token.empty() || std::isalpha(static_cast<unsigned char>(token.front()))) {
    return false;  // keywords: return, let, await
  }
  static constexpr std::string_view k_separators[] = {"(", ")", ",", ";", "{", "}", ":", "=>"};
  if (std::find(std::begin(k_separators), std::end(k_separators), token) !=
      std::end(k_separators)) {
    return false;
  }
  static constexpr std::string_view k_comparisons[] = {"==", "!=", "<=", ">=", "===", "!=="};
  if (token.back() == '=' &&
      std::find(std::begin(k_comparisons), std::end(k_comparisons), token) ==
        std::end(k_comparisons)) {
    return false;  // `=`, `:=`, `+=`: the whole right-hand side is the value
  }
  return true;
}

/// `2 * add(1, 2)`: the call is an operand, so `a + b` must come back as `(a + b)`
bool is_operand(const SourceFile & file, const ts_ll::Node & call)
{
  const ts_ll::Node parent = call.parent();
  if (parent.is_null()) {
    return false;
  }
  for (uint32_t i = 0; i < parent.child_count(); ++i) {
    const ts_ll::Node c = parent.child(i);
    if (!c.is_named() && is_operator_token(file.text(c))) {
      return true;
    }
  }
  return false;
}

/// Values that read as one operand wherever they are spliced
bool is_primary(const SourceFile & file, const ts_ll::Node & value)
{
  return value.child_count() == 0 || file.is_identifier(value) || file.is_literal(value) ||
         file.is_qualified_name(value) || file.is_call_expression(value) ||
         value.kind().find("parenthesized") != std::string_view::npos;
}

/// First identifier in `node`'s subtree, pre-order; null if none
ts_ll::Node first_identifier(const SourceFile & file, const ts_ll::Node & node)
{
  ts_ll::Node found;
  ts_ll::walk_depth_first(node, [&](const ts_ll::Node & n) {
    if (!found.is_null()) return false;
    if (file.is_identifier(n)) {
      found = n;
      return false;
    }
    return true;
  });
  return found;
}

/// Names bound by one parameter node; Go's `a, b int` binds two
std::vector<ts_ll::Node> parameter_names(const SourceFile & file, const ts_ll::Node & param)
{
  if (file.is_identifier(param)) {
    return {param};
  }
  std::vector<ts_ll::Node> names;
  for (const std::string_view field : file.grammar().parameter_name_fields) {
    for (const ts_ll::Node & f : param.children_by_field(field)) {
      const ts_ll::Node id = first_identifier(file, f);
      if (!id.is_null()) names.push_back(id);
    }
    if (!names.empty()) return names;
  }
  const ts_ll::Node id = first_identifier(file, param);
  if (!id.is_null()) names.push_back(id);
  return names;
}

/// Parameter list of a definition, searched outside the body if no field names it
ts_ll::Node find_parameter_list(const SourceFile & file, const FunctionDefinition & def)
{
  const Grammar & g = file.grammar();
  if (!g.parameters_field.empty()) {
    if (ts_ll::Node list = def.node.child_by_field(g.parameters_field); !list.is_null()) {
      return list;
    }
  }

  ts_ll::Node found;
  ts_ll::walk_depth_first(def.node, [&](const ts_ll::Node & n) {
    if (!found.is_null() || n == def.body) return false;
    if (contains_kind(g.parameter_list_kinds, n.kind())) {
      found = n;
      return false;
    }
    return true;
  });
  return found;
}

std::string_view definition_name(const SourceFile & file, const ts_ll::Node & def)
{
  if (ts_ll::Node name = def.child_by_field("name"); !name.is_null()) {
    return file.text(name);
  }
  // C family: function_definition -> function_declarator -> identifier
  ts_ll::Node d = def.child_by_field("declarator");
  while (!d.is_null() && !file.is_identifier(d)) {
    d = d.child_by_field("declarator");
  }
  return d.is_null() ? std::string_view() : file.text(d);
}

void replace_all(std::string & s, std::string_view from, std::string_view to)
{
  for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
  }
}

/**
 * Rewrite `region` of the target file with every parameter identifier
 * replaced by its substitution text.
 */
std::string substitute(
  const SourceFile & file, const ts_ll::Node & root, SourceRange region,
  const std::unordered_map<std::string_view, std::string> & substitutions)
{
  std::vector<Replacement> edits;
  ts_ll::walk_depth_first(root, [&](const ts_ll::Node & n) {
    if (n.end_byte() <= region.begin() || n.start_byte() >= region.end()) {
      return false;
    }
    if (file.is_identifier(n) && region.contains(n.range())) {
      if (auto it = substitutions.find(file.text(n)); it != substitutions.end()) {
        edits.push_back(
          {SourceRange(n.start_byte() - region.begin(), n.end_byte() - region.begin()),
           it->second});
      }
      return false;
    }
    return true;
  });
  return apply_replacements(file.source().get_source_slice(region), std::move(edits));
}

/**
 * Re-indent a multi-line body: the first line starts at the statement, the
 * following ones carry the definition's indentation, which is swapped for
 * the call site's.
 */
std::vector<std::string> reindent(
  std::string_view text, std::string_view from_indent, std::string_view to_indent)
{
  std::vector<std::string> lines;
  size_t start = 0;
  bool first = true;
  while (start <= text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) nl = text.size();
    std::string_view line = text.substr(start, nl - start);
    if (!first && line.substr(0, from_indent.size()) == from_indent) {
      line.remove_prefix(from_indent.size());
    }
    if (is_blank(line)) {
      lines.emplace_back();
    } else {
      lines.push_back(std::string(to_indent) + std::string(trim_right(line)));
    }
    first = false;
    start = nl + 1;
  }
  return lines;
}

}  // namespace

// ============================================================================
// Call site / definition lookup
// ============================================================================

Result<CallSite> Inliner::find_call(uint32_t offset) const
{
  const SourceFile & file = call_file_;
  const Grammar & g = file.grammar();

  CallSite site;
  site.call =
    file.innermost_at(offset, [&](const ts_ll::Node & n) { return file.is_call_expression(n); });
  if (site.call.is_null()) {
    return make_error(
      ErrorCode::CallNotFound, "no call expression at " + describe_point(file, offset));
  }

  if (ts_ll::Node args = site.call.child_by_field(g.call_arguments_field); !args.is_null()) {
    for (const ts_ll::Node & a : args.named_children()) {
      if (file.is_comment(a)) continue;

      Argument arg;
      if (!g.keyword_argument_kind.empty() && a.kind() == g.keyword_argument_kind) {
        arg.keyword = file.text(a.child_by_field("name"));
        arg.value = a.child_by_field("value");
      } else if (!g.argument_wrapper_kind.empty() && a.kind() == g.argument_wrapper_kind &&
                 a.named_child_count() > 0) {
        arg.value = a.named_child(a.named_child_count() - 1);
      } else {
        arg.value = a;
      }
      site.arguments.push_back(arg);
    }
  }

  site.statement = file.enclosing_statement(site.call);
  if (!site.statement.is_null()) {
    std::string_view stmt_text = trim_right(file.text(site.statement));
    if (!stmt_text.empty() && stmt_text.back() == ';') {
      stmt_text.remove_suffix(1);
    }
    site.standalone = trim_right(stmt_text) == file.text(site.call);
  }
  return site;
}

Result<FunctionDefinition> Inliner::find_definition(uint32_t offset) const
{
  const SourceFile & file = target_file_;
  const Grammar & g = file.grammar();

  FunctionDefinition def;
  def.node = file.innermost_at(
    offset, [&](const ts_ll::Node & n) { return file.is_function_definition(n); });
  if (def.node.is_null()) {
    return make_error(
      ErrorCode::TargetUnresolvable,
      "no function definition at " + describe_point(file, offset) + " of the target");
  }

  def.name = definition_name(file, def.node);
  def.body = def.node.child_by_field(g.function_body_field);
  if (def.body.is_null()) {
    return make_error(
      ErrorCode::TargetUnresolvable, "function '" + std::string(def.name) + "' has no body");
  }

  const auto add_parameter = [&](const ts_ll::Node & decl) {
    for (const ts_ll::Node & name : parameter_names(file, decl)) {
      def.parameters.push_back(Parameter{file.text(name), decl, name});
    }
  };

  const ts_ll::Node list = find_parameter_list(file, def);
  if (!list.is_null() && !contains_kind(g.parameter_list_kinds, list.kind())) {
    add_parameter(list);  // `x => ...` style lone parameter under the list field
  } else if (!list.is_null()) {
    for (const ts_ll::Node & p : list.named_children()) {
      if (file.is_comment(p) || contains_kind(g.skipped_parameter_kinds, p.kind())) continue;
      add_parameter(p);
    }
  } else if (!g.single_parameter_field.empty()) {
    if (ts_ll::Node p = def.node.child_by_field(g.single_parameter_field); !p.is_null()) {
      add_parameter(p);
    }
  }
  return def;
}

// ============================================================================
// Inlining
// ============================================================================

Result<std::string> Inliner::inline_call(uint32_t call_offset, uint32_t target_offset) const
{
  auto site_result = find_call(call_offset);
  if (!site_result) return site_result.error();
  auto def_result = find_definition(target_offset);
  if (!def_result) return def_result.error();

  const CallSite & site = site_result.value();
  const FunctionDefinition & def = def_result.value();
  const SourceFile & target = target_file_;
  const Grammar & tg = target.grammar();
  const std::string display_name = def.name.empty() ? "<anonymous>" : std::string(def.name);

  // --- Bind arguments to parameters -----------------------------------------
  if (site.arguments.size() != def.parameters.size()) {
    return make_error(
      ErrorCode::ArityMismatch, "'" + display_name + "' takes " +
                                  std::to_string(def.parameters.size()) +
                                  " parameter(s) but the call passes " +
                                  std::to_string(site.arguments.size()) + " argument(s)");
  }

  std::vector<const Argument *> bound(def.parameters.size(), nullptr);
  size_t next_positional = 0;
  for (const Argument & arg : site.arguments) {
    if (!arg.keyword.empty()) {
      const auto it = std::find_if(
        def.parameters.begin(), def.parameters.end(),
        [&](const Parameter & p) { return p.name == arg.keyword; });
      if (it == def.parameters.end()) {
        return make_error(
          ErrorCode::ArityMismatch,
          "'" + display_name + "' has no parameter named '" + std::string(arg.keyword) + "'");
      }
      const auto i = static_cast<size_t>(it - def.parameters.begin());
      if (bound[i]) {
        return make_error(
          ErrorCode::ArityMismatch,
          "parameter '" + std::string(arg.keyword) + "' of '" + display_name + "' bound twice");
      }
      bound[i] = &arg;
      continue;
    }
    while (next_positional < bound.size() && bound[next_positional]) ++next_positional;
    if (next_positional == bound.size()) {
      return make_error(
        ErrorCode::ArityMismatch, "too many positional arguments for '" + display_name + "'");
    }
    bound[next_positional++] = &arg;
  }

  std::unordered_map<std::string_view, std::string> substitutions;
  std::vector<std::string> temporaries;
  for (size_t i = 0; i < def.parameters.size(); ++i) {
    const Parameter & param = def.parameters[i];
    const ts_ll::Node & value = bound[i]->value;
    const std::string value_text(call_file_.text(value));

    const bool trivial = call_file_.is_identifier(value) || call_file_.is_literal(value);
    if (!options_.hoist_complex_arguments || trivial || tg.temp_format.empty()) {
      substitutions[param.name] = value_text;
      continue;
    }

    const std::string temp = options_.temp_prefix + std::string(param.name);
    const std::string_view decl_text = target.text(param.declaration);
    std::string decl(decl_text);
    decl.replace(
      param.name_node.start_byte() - param.declaration.start_byte(), param.name.size(), temp);

    std::string line(tg.temp_format);
    replace_all(line, "{decl}", decl);
    replace_all(line, "{name}", temp);
    replace_all(line, "{value}", value_text);
    temporaries.push_back(std::move(line));
    substitutions[param.name] = temp;
  }

  // --- Split the body into statements and the returned value ----------------
  std::vector<ts_ll::Node> items;
  ts_ll::Node value;
  if (!target.is_block(def.body)) {
    value = def.body;  // expression-bodied lambda
  } else {
    items = def.body.named_children();
    if (items.size() == 1 && contains_kind(tg.sequence_kinds, items.front().kind())) {
      items = items.front().named_children();  // Go: block -> statement_list
    }
    auto last = std::find_if(items.rbegin(), items.rend(), [&](const ts_ll::Node & n) {
      return !target.is_comment(n);
    });

    if (last != items.rend()) {
      ts_ll::Node ret;
      if (target.is_return(*last)) {
        ret = *last;
      } else if (
        !target.is_block(*last) && last->named_child_count() == 1 &&
        target.is_return(last->named_child(0))) {
        ret = last->named_child(0);  // Rust `return x;` inside expression_statement
      }

      if (!ret.is_null()) {
        for (const ts_ll::Node & c : ret.named_children()) {
          if (!target.is_comment(c)) {
            value = c;
            break;
          }
        }
        items.erase(std::next(last).base(), items.end());
      } else if (tg.implicit_return && !contains_kind(tg.statement_kinds, last->kind())) {
        // A discarded tail value still runs for its side effects.
        value = *last;
        if (!site.standalone) {
          items.erase(std::next(last).base(), items.end());
        }
      }
    }
  }

  if (!site.standalone && value.is_null()) {
    return make_error(
      ErrorCode::MissingReturnValue,
      "the call's value is used but '" + display_name + "' returns no value");
  }

  size_t early_returns = 0;
  for (const ts_ll::Node & item : items) {
    ts_ll::walk_depth_first(item, [&](const ts_ll::Node & n) {
      if (target.is_function_definition(n)) return false;
      if (target.is_return(n)) ++early_returns;
      return true;
    });
  }
  if (early_returns > 0) {
    spdlog::warn(
      "'{}' has {} return(s) before its end; they are inlined verbatim", display_name,
      early_returns);
  }

  // --- Assemble the new call file -------------------------------------------
  const SourceManager & sm = call_file_.source();
  const std::string_view src = sm.get_source();
  const ts_ll::Node anchor = site.statement.is_null() ? site.call : site.statement;
  const uint32_t line_start = sm.get_line_offset(sm.get_line_index(anchor.start_byte()));
  const std::string_view indent = call_file_.line_indent(anchor.start_byte());

  std::string out(src.substr(0, line_start));

  if (site.standalone) {
    const std::string_view lead = src.substr(line_start, anchor.start_byte() - line_start);
    if (!is_blank(lead)) {
      out += trim_right(lead);
      out += '\n';
    }
  }

  for (const std::string & temp : temporaries) {
    out += indent;
    out += temp;
    out += '\n';
  }

  if (!items.empty()) {
    const SourceRange region(items.front().start_byte(), items.back().end_byte());
    const std::string body = substitute(target, def.body, region, substitutions);
    for (const std::string & line :
         reindent(body, target.line_indent(region.begin()), indent)) {
      out += line;
      out += '\n';
    }
  }

  if (site.standalone) {
    std::string_view rest = src.substr(anchor.end_byte());
    const size_t nl = rest.find('\n');
    if (is_blank(rest.substr(0, nl))) {
      rest = nl == std::string_view::npos ? std::string_view() : rest.substr(nl + 1);
    }
    out += rest;
  } else {
    out += src.substr(line_start, site.call.start_byte() - line_start);
    const std::string spliced = substitute(target, value, value.range(), substitutions);
    if (is_operand(call_file_, site.call) && !is_primary(target, value)) {
      out += "(" + spliced + ")";
    } else {
      out += spliced;
    }
    out += src.substr(site.call.end_byte());
  }

  spdlog::info(
    "inlined '{}' ({} statement(s), {} temporary(ies)) into '{}'", display_name, items.size(),
    temporaries.size(), call_file_.filename());
  return out;
}

}  // namespace sce
