#include <ebnf/errors.hpp>

#include <sstream>

namespace ebnf {

  namespace {

    std::string
    join(const std::vector<std::string>& items, const std::string& sep,
         bool quoted) {
      std::string out;
      for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        if (quoted)
          out += "\"" + items[i] + "\"";
        else
          out += items[i];
      }
      return out;
    }

    std::string
    describe(const token& tok) {
      if (tok.kind == end_of_input_kind) return "end of input";
      return "\"" + tok.text + "\"";
    }

    std::string
    at(const source_position& pos) {
      std::ostringstream os;
      os << pos;
      return os.str();
    }

  } // namespace

  grammar_syntax_error::grammar_syntax_error(std::size_t line,
                                             std::size_t column,
                                             std::string expected,
                                             const std::string& found)
      : grammar_error("grammar syntax error (line " + std::to_string(line) +
                      ", column " + std::to_string(column) + "): expected " +
                      expected + ", found " + found),
        line_(line), column_(column), expected_(std::move(expected)) {}

  duplicate_rule_error::duplicate_rule_error(std::string name)
      : grammar_error("duplicate rule '" + name + "'"), name_(std::move(name)) {
  }

  undefined_rule_error::undefined_rule_error(std::string name,
                                             std::string referenced_from)
      : grammar_error(
            referenced_from.empty()
                ? "entry rule '" + name + "' is not defined"
                : "undefined rule '" + name + "' referenced from '" +
                      referenced_from + "'"),
        name_(std::move(name)), referenced_from_(std::move(referenced_from)) {}

  left_recursion_error::left_recursion_error(std::vector<std::string> cycle)
      : grammar_error("left recursion: " + join(cycle, " -> ", false) +
                      (cycle.empty() ? "" : " -> " + cycle.front())),
        cycle_(std::move(cycle)) {}

  infinite_loop_error::infinite_loop_error(std::string rule)
      : grammar_error("repetition in rule '" + rule +
                      "' can match the empty string"),
        rule_(std::move(rule)) {}

  std::string
  grammar_warning::message() const {
    switch (kind) {
      case warning_kind::unreachable_rule:
        return "rule '" + rule + "' is unreachable from the entry rule";
      case warning_kind::ambiguity: {
        std::string alts;
        for (std::size_t i = 0; i < alternatives.size(); ++i) {
          if (i > 0) alts += " and ";
          alts += std::to_string(alternatives[i]);
        }
        return "alternatives " + alts + " in rule '" + rule +
               "' share first terminals " + join(overlap, ", ", true) +
               "; the earlier alternative wins";
      }
    }
    return {};
  }

  std::ostream&
  operator<<(std::ostream& os, const grammar_warning& w) {
    return os << w.message();
  }

  parse_syntax_error::parse_syntax_error(std::vector<std::string> expected,
                                         token actual)
      : parse_error("parse error (" + at(actual.position) + "): expected " +
                        (expected.empty() ? std::string("nothing")
                                          : join(expected, ", ", true)) +
                        ", found " + describe(actual),
                    actual.position),
        expected_(std::move(expected)), actual_(std::move(actual)) {}

  trailing_input_error::trailing_input_error(token actual)
      : parse_error("parse error (" + at(actual.position) +
                        "): unexpected trailing input " + describe(actual),
                    actual.position),
        actual_(std::move(actual)) {}

  recursion_depth_exceeded_error::recursion_depth_exceeded_error(
      std::size_t limit, source_position position)
      : parse_error("parse error (" + at(position) +
                        "): recursion depth limit of " +
                        std::to_string(limit) + " exceeded",
                    position),
        limit_(limit) {}

} // namespace ebnf
