// sce/syntax/grammars.cpp - Node-kind tables for the bundled grammars
#include "sce/syntax/grammar.hpp"

#include <array>

extern "C" {
const TSLanguage * tree_sitter_c();
const TSLanguage * tree_sitter_cpp();
const TSLanguage * tree_sitter_c_sharp();
const TSLanguage * tree_sitter_go();
const TSLanguage * tree_sitter_java();
const TSLanguage * tree_sitter_javascript();
const TSLanguage * tree_sitter_python();
const TSLanguage * tree_sitter_ruby();
const TSLanguage * tree_sitter_rust();
const TSLanguage * tree_sitter_typescript();
const TSLanguage * tree_sitter_tsx();
}

namespace sce
{

namespace
{

// ============================================================================
// C family
// ============================================================================

Grammar make_c()
{
  Grammar g;
  g.id = GrammarId::C;
  g.language = tree_sitter_c;

  g.identifier_kinds = {"identifier"};
  g.qualified_names = {{"field_expression", "argument"}};
  g.binding_fields = {
    {"init_declarator", "declarator"},
    {"declaration", "declarator"},
    {"parameter_declaration", "declarator"},
    {"assignment_expression", "left"},
    {"update_expression", "argument"},
  };

  g.statement_kinds = {
    "expression_statement", "declaration",    "compound_statement", "if_statement",
    "switch_statement",     "case_statement", "while_statement",    "do_statement",
    "for_statement",        "return_statement", "break_statement",  "continue_statement",
    "goto_statement",       "labeled_statement", "attributed_statement",
  };
  g.block_kinds = {"compound_statement"};
  g.sequence_kinds = {"case_statement"};
  g.comment_kinds = {"comment"};

  g.call_kinds = {"call_expression"};

  g.function_kinds = {"function_definition"};
  g.parameter_list_kinds = {"parameter_list"};
  g.skipped_parameter_kinds = {"variadic_parameter", "comment"};
  g.parameter_name_fields = {"declarator"};
  g.return_kinds = {"return_statement"};
  g.literal_kinds = {
    "number_literal", "string_literal", "char_literal", "concatenated_string",
    "true",           "false",          "null",
  };
  g.temp_format = "{decl} = {value};";
  return g;
}

Grammar make_cpp()
{
  Grammar g = make_c();
  g.id = GrammarId::Cpp;
  g.language = tree_sitter_cpp;

  g.binding_fields.push_back({"for_range_loop", "declarator"});
  g.binding_fields.push_back({"optional_parameter_declaration", "declarator"});

  for (const std::string_view kind :
       {"for_range_loop", "try_statement", "throw_statement", "co_return_statement",
        "co_yield_statement"}) {
    g.statement_kinds.push_back(kind);
  }
  g.sequence_kinds.push_back("declaration_list");

  g.function_kinds.push_back("lambda_expression");
  g.skipped_parameter_kinds.push_back("variadic_parameter_declaration");
  g.literal_kinds.push_back("nullptr");
  g.literal_kinds.push_back("raw_string_literal");
  return g;
}

Grammar make_csharp()
{
  Grammar g;
  g.id = GrammarId::CSharp;
  g.language = tree_sitter_c_sharp;

  g.identifier_kinds = {"identifier"};
  g.qualified_names = {{"member_access_expression", "expression"}};
  g.binding_fields = {
    {"variable_declarator", "name"},
    {"assignment_expression", "left"},
    {"foreach_statement", "left"},
    {"parameter", "name"},
  };

  g.statement_kinds = {
    "expression_statement", "local_declaration_statement", "block",
    "if_statement",         "switch_statement",            "while_statement",
    "do_statement",         "for_statement",               "foreach_statement",
    "return_statement",     "break_statement",             "continue_statement",
    "throw_statement",      "try_statement",               "using_statement",
    "lock_statement",       "yield_statement",             "goto_statement",
    "labeled_statement",    "checked_statement",           "unsafe_statement",
    "fixed_statement",      "local_function_statement",    "empty_statement",
  };
  g.block_kinds = {"block"};
  g.sequence_kinds = {"switch_section"};
  g.comment_kinds = {"comment"};

  g.call_kinds = {"invocation_expression"};
  g.argument_wrapper_kind = "argument";

  g.function_kinds = {
    "method_declaration", "constructor_declaration", "local_function_statement",
    "lambda_expression",
  };
  g.parameters_field = "parameters";
  g.parameter_list_kinds = {"parameter_list"};
  g.skipped_parameter_kinds = {"comment"};
  g.parameter_name_fields = {"name"};
  g.return_kinds = {"return_statement"};
  g.literal_kinds = {
    "integer_literal",   "real_literal", "string_literal", "verbatim_string_literal",
    "character_literal", "boolean_literal", "null_literal",
  };
  g.temp_format = "{decl} = {value};";
  return g;
}

Grammar make_java()
{
  Grammar g;
  g.id = GrammarId::Java;
  g.language = tree_sitter_java;

  g.identifier_kinds = {"identifier"};
  g.qualified_names = {{"field_access", "object"}};
  g.binding_fields = {
    {"variable_declarator", "name"},
    {"assignment_expression", "left"},
    {"enhanced_for_statement", "name"},
    {"formal_parameter", "name"},
    {"catch_formal_parameter", "name"},
  };

  g.statement_kinds = {
    "expression_statement", "local_variable_declaration", "block",
    "if_statement",         "while_statement",            "for_statement",
    "enhanced_for_statement", "do_statement",             "switch_statement",
    "try_statement",        "try_with_resources_statement", "return_statement",
    "yield_statement",      "break_statement",            "continue_statement",
    "throw_statement",      "synchronized_statement",     "labeled_statement",
    "assert_statement",     "empty_statement",
  };
  g.block_kinds = {"block"};
  g.sequence_kinds = {"switch_block_statement_group"};
  g.comment_kinds = {"line_comment", "block_comment", "comment"};

  g.call_kinds = {"method_invocation", "object_creation_expression"};

  g.function_kinds = {"method_declaration", "constructor_declaration", "lambda_expression"};
  g.parameters_field = "parameters";
  g.parameter_list_kinds = {"formal_parameters"};
  g.skipped_parameter_kinds = {"receiver_parameter", "line_comment", "block_comment"};
  g.parameter_name_fields = {"name"};
  g.return_kinds = {"return_statement"};
  g.literal_kinds = {
    "decimal_integer_literal", "hex_integer_literal",  "octal_integer_literal",
    "binary_integer_literal",  "decimal_floating_point_literal", "string_literal",
    "character_literal",       "true",                 "false",
    "null_literal",
  };
  g.temp_format = "{decl} = {value};";
  return g;
}

Grammar make_go()
{
  Grammar g;
  g.id = GrammarId::Go;
  g.language = tree_sitter_go;

  g.identifier_kinds = {"identifier"};
  g.qualified_names = {{"selector_expression", "operand"}};
  g.binding_fields = {
    {"short_var_declaration", "left"},
    {"assignment_statement", "left"},
    {"var_spec", "name"},
    {"const_spec", "name"},
    {"range_clause", "left"},
    {"parameter_declaration", "name"},
  };

  g.statement_kinds = {
    "expression_statement", "short_var_declaration", "assignment_statement",
    "inc_statement",        "dec_statement",         "var_declaration",
    "const_declaration",    "type_declaration",      "block",
    "if_statement",         "for_statement",         "expression_switch_statement",
    "type_switch_statement", "select_statement",     "return_statement",
    "go_statement",         "defer_statement",       "break_statement",
    "continue_statement",   "goto_statement",        "fallthrough_statement",
    "labeled_statement",    "send_statement",        "empty_statement",
  };
  g.block_kinds = {"block"};
  g.sequence_kinds = {
    "statement_list", "expression_case", "default_case", "type_case", "communication_case"};
  g.comment_kinds = {"comment"};

  g.call_kinds = {"call_expression"};

  g.function_kinds = {"function_declaration", "method_declaration", "func_literal"};
  g.parameters_field = "parameters";
  g.parameter_list_kinds = {"parameter_list"};
  g.skipped_parameter_kinds = {"comment"};
  g.parameter_name_fields = {"name"};
  g.return_kinds = {"return_statement"};
  g.literal_kinds = {
    "int_literal",  "float_literal", "imaginary_literal", "rune_literal",
    "interpreted_string_literal", "raw_string_literal", "true", "false",
    "nil",
  };
  g.temp_format = "{name} := {value}";
  return g;
}

Grammar make_rust()
{
  Grammar g;
  g.id = GrammarId::Rust;
  g.language = tree_sitter_rust;

  g.identifier_kinds = {"identifier"};
  g.qualified_names = {{"field_expression", "value"}};
  g.binding_fields = {
    {"let_declaration", "pattern"},
    {"assignment_expression", "left"},
    {"compound_assignment_expr", "left"},
    {"for_expression", "pattern"},
    {"parameter", "pattern"},
    {"closure_parameters", ""},
  };

  g.statement_kinds = {"expression_statement", "let_declaration", "empty_statement"};
  g.block_kinds = {"block"};
  g.comment_kinds = {"line_comment", "block_comment"};

  g.call_kinds = {"call_expression"};

  g.function_kinds = {"function_item", "closure_expression"};
  g.parameters_field = "parameters";
  g.parameter_list_kinds = {"parameters", "closure_parameters"};
  g.skipped_parameter_kinds = {"self_parameter", "attribute_item", "line_comment",
                               "block_comment"};
  g.parameter_name_fields = {"pattern"};
  g.return_kinds = {"return_expression"};
  g.implicit_return = true;
  g.literal_kinds = {
    "integer_literal", "float_literal", "string_literal", "raw_string_literal",
    "char_literal",    "boolean_literal",
  };
  g.temp_format = "let {decl} = {value};";
  return g;
}

// ============================================================================
// Scripting languages
// ============================================================================

Grammar make_javascript()
{
  Grammar g;
  g.id = GrammarId::JavaScript;
  g.language = tree_sitter_javascript;

  g.identifier_kinds = {
    "identifier", "shorthand_property_identifier", "shorthand_property_identifier_pattern"};
  g.qualified_names = {{"member_expression", "object"}};
  g.binding_fields = {
    {"variable_declarator", "name"},
    {"assignment_expression", "left"},
    {"augmented_assignment_expression", "left"},
    {"update_expression", "argument"},
    {"for_in_statement", "left"},
    {"formal_parameters", ""},
  };

  g.statement_kinds = {
    "expression_statement", "variable_declaration", "lexical_declaration",
    "statement_block",      "if_statement",         "switch_statement",
    "for_statement",        "for_in_statement",     "while_statement",
    "do_statement",         "try_statement",        "with_statement",
    "break_statement",      "continue_statement",   "return_statement",
    "throw_statement",      "empty_statement",      "labeled_statement",
    "debugger_statement",   "function_declaration", "generator_function_declaration",
    "class_declaration",    "import_statement",     "export_statement",
  };
  g.block_kinds = {"statement_block"};
  g.sequence_kinds = {"switch_case", "switch_default"};
  g.comment_kinds = {"comment"};

  g.call_kinds = {"call_expression", "new_expression"};

  g.function_kinds = {
    "function_declaration", "generator_function_declaration", "function_expression",
    "function",             "generator_function",             "arrow_function",
    "method_definition",
  };
  g.parameters_field = "parameters";
  g.single_parameter_field = "parameter";
  g.parameter_list_kinds = {"formal_parameters"};
  g.skipped_parameter_kinds = {"comment"};
  g.parameter_name_fields = {"pattern", "left"};
  g.return_kinds = {"return_statement"};
  g.literal_kinds = {
    "number", "string", "template_string", "regex", "true", "false", "null", "undefined",
  };
  g.temp_format = "const {name} = {value};";
  return g;
}

Grammar make_typescript(GrammarId id, const TSLanguage * (*language)())
{
  Grammar g = make_javascript();
  g.id = id;
  g.language = language;

  for (const std::string_view kind :
       {"interface_declaration", "type_alias_declaration", "enum_declaration",
        "abstract_class_declaration", "ambient_declaration"}) {
    g.statement_kinds.push_back(kind);
  }
  g.binding_fields.push_back({"required_parameter", "pattern"});
  g.binding_fields.push_back({"optional_parameter", "pattern"});
  return g;
}

Grammar make_python()
{
  Grammar g;
  g.id = GrammarId::Python;
  g.language = tree_sitter_python;

  g.identifier_kinds = {"identifier"};
  g.qualified_names = {{"attribute", "object"}};
  g.receiver_names = {"self", "cls"};
  g.binding_fields = {
    {"assignment", "left"},
    {"augmented_assignment", "left"},
    {"for_statement", "left"},
    {"for_in_clause", "left"},
    {"as_pattern", "alias"},
    {"named_expression", "name"},
    {"function_definition", "name"},
    {"class_definition", "name"},
    {"parameters", ""},
    {"lambda_parameters", ""},
  };

  g.statement_kinds = {
    "expression_statement", "return_statement",      "pass_statement",
    "delete_statement",     "raise_statement",       "assert_statement",
    "global_statement",     "nonlocal_statement",    "import_statement",
    "import_from_statement", "future_import_statement", "print_statement",
    "exec_statement",       "break_statement",       "continue_statement",
    "type_alias_statement", "if_statement",          "for_statement",
    "while_statement",      "try_statement",         "with_statement",
    "match_statement",      "function_definition",   "class_definition",
    "decorated_definition",
  };
  g.block_kinds = {"block"};
  g.comment_kinds = {"comment"};

  g.call_kinds = {"call"};
  g.keyword_argument_kind = "keyword_argument";

  g.function_kinds = {"function_definition", "lambda"};
  g.parameters_field = "parameters";
  g.parameter_list_kinds = {"parameters", "lambda_parameters"};
  g.skipped_parameter_kinds = {"keyword_separator", "positional_separator", "comment"};
  g.parameter_name_fields = {"name"};
  g.return_kinds = {"return_statement"};
  g.literal_kinds = {
    "integer", "float", "string", "concatenated_string", "true", "false", "none",
  };
  g.temp_format = "{name} = {value}";
  return g;
}

Grammar make_ruby()
{
  Grammar g;
  g.id = GrammarId::Ruby;
  g.language = tree_sitter_ruby;

  g.identifier_kinds = {"identifier"};
  g.binding_fields = {
    {"assignment", "left"},
    {"operator_assignment", "left"},
    {"for", "pattern"},
    {"method_parameters", ""},
    {"block_parameters", ""},
    {"lambda_parameters", ""},
  };

  // Ruby has no statement nodes: every expression in a body sequence is one
  g.statement_container_kinds = {
    "program", "body_statement", "then",  "else",      "do",
    "begin",   "ensure",         "block_body", "parenthesized_statements",
  };
  g.block_kinds = {"body_statement", "then", "else", "do", "ensure", "block_body"};
  g.comment_kinds = {"comment", "heredoc_body"};

  g.call_kinds = {"call"};

  g.function_kinds = {"method", "singleton_method"};
  g.parameters_field = "parameters";
  g.parameter_list_kinds = {"method_parameters"};
  g.skipped_parameter_kinds = {"comment"};
  g.parameter_name_fields = {"name"};
  g.return_kinds = {"return"};
  g.implicit_return = true;
  g.literal_kinds = {
    "integer", "float", "string", "simple_symbol", "true", "false", "nil",
  };
  g.temp_format = "{name} = {value}";
  return g;
}

}  // namespace

const Grammar & grammar_for(GrammarId id)
{
  static const std::array<Grammar, 11> k_grammars = {
    make_c(),
    make_cpp(),
    make_csharp(),
    make_go(),
    make_java(),
    make_javascript(),
    make_python(),
    make_ruby(),
    make_rust(),
    make_typescript(GrammarId::TypeScript, tree_sitter_typescript),
    make_typescript(GrammarId::Tsx, tree_sitter_tsx),
  };
  return k_grammars[static_cast<size_t>(id)];
}

}  // namespace sce
