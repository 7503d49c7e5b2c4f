#include <ebnf/parser.hpp>
#include <ebnf/scanner.hpp>

#include <algorithm>
#include <stdexcept>

namespace ebnf {

  namespace {

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    void
    advance(source_position& pos, std::string_view text) {
      for (char c : text) {
        ++pos.offset;
        if (c == '\n') {
          ++pos.line;
          pos.column = 1;
        } else {
          ++pos.column;
        }
      }
    }

  } // namespace

  scanner::scanner(std::vector<std::string> vocabulary)
      : vocabulary_(std::move(vocabulary)) {
    for (const auto& v : vocabulary_) {
      if (v.empty())
        throw std::invalid_argument("scanner: empty vocabulary entry");
    }
    std::sort(vocabulary_.begin(), vocabulary_.end());
    vocabulary_.erase(std::unique(vocabulary_.begin(), vocabulary_.end()),
                      vocabulary_.end());
    std::stable_sort(vocabulary_.begin(), vocabulary_.end(),
                     [](const std::string& a, const std::string& b) {
                       return a.size() > b.size();
                     });
  }

  std::vector<token>
  scanner::scan(std::string_view input) const {
    std::vector<token> tokens;
    source_position pos;
    std::size_t i = 0;
    while (i < input.size()) {
      auto rest = input.substr(i);
      auto hit = std::find_if(
          vocabulary_.begin(), vocabulary_.end(),
          [rest](const std::string& v) { return rest.substr(0, v.size()) == v; });
      std::string_view text;
      std::string kind;
      if (hit != vocabulary_.end()) {
        text = rest.substr(0, hit->size());
        kind = literal_kind;
      } else if (is_space(rest.front())) {
        advance(pos, rest.substr(0, 1));
        ++i;
        continue;
      } else {
        text = rest.substr(0, 1);
        kind = unknown_kind;
      }
      tokens.push_back(token{std::move(kind), std::string(text), pos});
      advance(pos, text);
      i += text.size();
    }
    return tokens;
  }

  scanner
  scanner::for_parser(const grammar_parser& parser) {
    return scanner(parser.model().terminals());
  }

} // namespace ebnf
