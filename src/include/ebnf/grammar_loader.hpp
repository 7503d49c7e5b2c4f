#pragma once

#include <ebnf/grammar.hpp>

#include <string>

namespace ebnf {

  // Reads EBNF text (`name = rhs ;` rules) into a grammar. Throws
  // grammar_syntax_error on the first malformed construct.
  class grammar_loader {
  public:
    grammar
    load(const std::string& source) const;
  };

} // namespace ebnf
