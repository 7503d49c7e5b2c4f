#pragma once

#include <ebnf/grammar.hpp>

#include <set>
#include <string>
#include <unordered_map>

namespace ebnf {

  // Terminals are identified by their literal text.
  using terminal_set = std::set<std::string>;

  // Member of FOLLOW sets standing for the end of the input. Literals are
  // never empty, so the empty string cannot clash with one.
  inline const std::string end_marker{};

  class lookahead_sets {
    std::unordered_map<std::string, bool> nullable_;
    std::unordered_map<std::string, terminal_set> first_;
    std::unordered_map<std::string, terminal_set> follow_;

    friend lookahead_sets
    compute_lookahead_sets(const grammar& g);

  public:
    bool
    nullable(const std::string& rule) const;

    bool
    nullable(const alternative& alt) const;

    bool
    nullable(const term& t) const;

    terminal_set
    first(const std::string& rule) const;

    terminal_set
    first(const alternative& alt) const;

    terminal_set
    first(const term& t) const;

    terminal_set
    follow(const std::string& rule) const;
  };

  // Nullable, FIRST and FOLLOW for every rule, iterated to a fixed point.
  // References to undefined rules count as non-nullable with no FIRST.
  lookahead_sets
  compute_lookahead_sets(const grammar& g);

} // namespace ebnf
