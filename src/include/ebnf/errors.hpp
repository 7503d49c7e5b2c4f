#pragma once

#include <ebnf/token.hpp>

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ebnf {

  // ---------------------------------------------------------------------------
  // Compile-time errors
  // ---------------------------------------------------------------------------

  class grammar_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class grammar_syntax_error : public grammar_error {
    std::size_t line_;
    std::size_t column_;
    std::string expected_;

  public:
    grammar_syntax_error(std::size_t line, std::size_t column,
                         std::string expected, const std::string& found);

    std::size_t
    line() const {
      return line_;
    }

    std::size_t
    column() const {
      return column_;
    }

    const std::string&
    expected() const {
      return expected_;
    }
  };

  class duplicate_rule_error : public grammar_error {
    std::string name_;

  public:
    explicit duplicate_rule_error(std::string name);

    const std::string&
    name() const {
      return name_;
    }
  };

  class undefined_rule_error : public grammar_error {
    std::string name_;
    std::string referenced_from_;

  public:
    undefined_rule_error(std::string name, std::string referenced_from);

    const std::string&
    name() const {
      return name_;
    }

    // Empty when the missing rule is the designated entry rule.
    const std::string&
    referenced_from() const {
      return referenced_from_;
    }
  };

  class left_recursion_error : public grammar_error {
    std::vector<std::string> cycle_;

  public:
    explicit left_recursion_error(std::vector<std::string> cycle);

    const std::vector<std::string>&
    cycle() const {
      return cycle_;
    }
  };

  class infinite_loop_error : public grammar_error {
    std::string rule_;

  public:
    explicit infinite_loop_error(std::string rule);

    const std::string&
    rule() const {
      return rule_;
    }
  };

  // ---------------------------------------------------------------------------
  // Compile-time warnings
  // ---------------------------------------------------------------------------

  enum class warning_kind { unreachable_rule, ambiguity };

  struct grammar_warning {
    warning_kind kind = warning_kind::unreachable_rule;
    std::string rule;
    // Indices of the overlapping alternatives within one choice.
    std::vector<std::size_t> alternatives;
    std::vector<std::string> overlap;

    std::string
    message() const;

    bool
    operator==(const grammar_warning&) const = default;
  };

  std::ostream&
  operator<<(std::ostream& os, const grammar_warning& w);

  // ---------------------------------------------------------------------------
  // Parse-time errors
  // ---------------------------------------------------------------------------

  class parse_error : public std::runtime_error {
    source_position position_;

  public:
    parse_error(const std::string& what, source_position position)
        : std::runtime_error(what), position_(position) {}

    const source_position&
    position() const {
      return position_;
    }
  };

  class parse_syntax_error : public parse_error {
    std::vector<std::string> expected_;
    token actual_;

  public:
    parse_syntax_error(std::vector<std::string> expected, token actual);

    // Literals that would have allowed the parse to continue, sorted.
    const std::vector<std::string>&
    expected() const {
      return expected_;
    }

    // Offending token; kind "<eof>" and empty text at end of input.
    const token&
    actual() const {
      return actual_;
    }
  };

  class trailing_input_error : public parse_error {
    token actual_;

  public:
    explicit trailing_input_error(token actual);

    const token&
    actual() const {
      return actual_;
    }
  };

  class recursion_depth_exceeded_error : public parse_error {
    std::size_t limit_;

  public:
    recursion_depth_exceeded_error(std::size_t limit, source_position position);

    std::size_t
    limit() const {
      return limit_;
    }
  };

  inline constexpr const char* end_of_input_kind = "<eof>";

} // namespace ebnf
