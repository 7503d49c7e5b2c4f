#pragma once

#include <ebnf/errors.hpp>
#include <ebnf/grammar.hpp>
#include <ebnf/parser.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace ebnf {

  struct compile_options {
    // Rule parsed by grammar_parser::parse(); empty selects the first rule.
    std::string entry_rule;
    // Rewrite immediate left recursion before validation.
    bool resolve_left_recursion = true;
    parser_options parser;
    // Receives one "ebnf: warning: ..." line per warning when set.
    std::ostream* diagnostics = nullptr;
  };

  struct compile_result {
    grammar_parser parser;
    std::vector<grammar_warning> warnings;
  };

  // Load, rewrite, validate, build and emit. Fatal grammar errors propagate;
  // no parser is produced for an invalid grammar.
  compile_result
  compile(const std::string& text, const compile_options& options = {});

  // Same pipeline over an already loaded grammar.
  compile_result
  compile(grammar g, const compile_options& options = {});

} // namespace ebnf
