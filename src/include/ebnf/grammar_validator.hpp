#pragma once

#include <ebnf/errors.hpp>
#include <ebnf/grammar.hpp>

#include <vector>

namespace ebnf {

  struct validation_result {
    std::vector<grammar_warning> warnings;
  };

  // Structural checks, in order: unique names, resolved references (and
  // entry rule), reachability, left recursion, repetitions that can match
  // nothing, overlapping choice alternatives. Fatal findings throw the
  // matching grammar_error; unreachable rules and ambiguities are returned
  // as warnings.
  class grammar_validator {
  public:
    validation_result
    validate(const grammar& g) const;
  };

} // namespace ebnf
