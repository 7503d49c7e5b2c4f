#pragma once

#include <ebnf/cpp_code.hpp>
#include <ebnf/grammar.hpp>

#include <string>

namespace ebnf {

  struct rule_header_options {
    std::string filename = "grammar_rules.hpp";
    std::string namespace_name = "grammar";
    // Entry rule baked into make_parser(); empty selects the first rule.
    std::string entry_rule;
  };

  // Escapes rule names that are not usable as C++ enumerators: keywords get
  // a trailing underscore, as do names reserved to the implementation.
  std::string
  rule_identifier(const std::string& rule_name);

  // Describes a header with `enum class rule` (one enumerator per rule, in
  // declaration order), to_string/rule_from_string, the grammar text, an
  // inline make_parser() compiling it, and procedure(parser, rule) returning
  // the parse entry point of one rule.
  cpp_file
  generate_rule_header(const grammar& g, const rule_header_options& opts = {});

} // namespace ebnf
