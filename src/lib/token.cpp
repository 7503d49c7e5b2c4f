#include <ebnf/token.hpp>

namespace ebnf {

  std::ostream&
  operator<<(std::ostream& os, const source_position& pos) {
    return os << "line " << pos.line << ", column " << pos.column;
  }

  source_position
  end_position(const std::vector<token>& tokens) {
    if (tokens.empty()) return {};
    source_position pos = tokens.back().position;
    for (char c : tokens.back().text) {
      ++pos.offset;
      if (c == '\n') {
        ++pos.line;
        pos.column = 1;
      } else {
        ++pos.column;
      }
    }
    return pos;
  }

  std::vector<token>
  drain(token_source& source) {
    std::vector<token> tokens;
    while (auto tok = source.next())
      tokens.push_back(std::move(*tok));
    return tokens;
  }

} // namespace ebnf
