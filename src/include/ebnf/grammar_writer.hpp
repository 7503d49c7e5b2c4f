#pragma once

#include <ebnf/grammar.hpp>

#include <string>

namespace ebnf {

  // Renders IR back to EBNF source that grammar_loader reads into an equal
  // grammar.
  class grammar_writer {
  public:
    std::string
    write(const grammar& g) const;

    std::string
    write(const grammar_rule& rule) const;

    std::string
    write(const term& t) const;
  };

} // namespace ebnf
