#pragma once

#include <ebnf/token.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ebnf {

  class grammar_parser;

  // Minimal lexer over a fixed vocabulary of literal texts. At each position
  // the longest vocabulary entry wins; otherwise whitespace is skipped, and
  // any other character becomes a one-character token of kind "unknown".
  class scanner {
    std::vector<std::string> vocabulary_; // longest first

  public:
    explicit scanner(std::vector<std::string> vocabulary);

    std::vector<token>
    scan(std::string_view input) const;

    const std::vector<std::string>&
    vocabulary() const {
      return vocabulary_;
    }

    // Scanner over every literal of the parser's grammar.
    static scanner
    for_parser(const grammar_parser& parser);
  };

  inline constexpr const char* literal_kind = "literal";
  inline constexpr const char* unknown_kind = "unknown";

} // namespace ebnf
