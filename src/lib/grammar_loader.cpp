#include <ebnf/errors.hpp>
#include <ebnf/grammar_loader.hpp>

#include <cctype>
#include <vector>

namespace ebnf {

  namespace {

    // -----------------------------------------------------------------------
    // Token types
    // -----------------------------------------------------------------------

    enum class token_kind {
      eof,
      identifier,
      literal,
      eq,        // =
      comma,     // ,
      pipe,      // |
      semicolon, // ;
      minus,     // -
      lparen,    // (
      rparen,    // )
      lbracket,  // [
      rbracket,  // ]
      lbrace,    // {
      rbrace,    // }
    };

    struct meta_token {
      token_kind kind = token_kind::eof;
      std::string value;
      std::size_t line = 1;
      std::size_t column = 1;
    };

    std::string
    describe(const meta_token& tok) {
      switch (tok.kind) {
        case token_kind::eof:
          return "end of input";
        case token_kind::identifier:
          return "identifier '" + tok.value + "'";
        case token_kind::literal:
          return "literal \"" + tok.value + "\"";
        default:
          return "'" + tok.value + "'";
      }
    }

    bool
    is_identifier_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool
    is_identifier_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    // -----------------------------------------------------------------------
    // Lexer
    // -----------------------------------------------------------------------

    class lexer {
    public:
      explicit lexer(const std::string& source) : src_(source) {}

      meta_token
      next() {
        skip_whitespace_and_comments();

        meta_token tok;
        tok.line = line_;
        tok.column = column_;
        if (pos_ >= src_.size()) return tok;

        char c = src_[pos_];

        if (c == '"' || c == '\'') return read_literal(tok);

        if (is_identifier_start(c)) {
          tok.kind = token_kind::identifier;
          while (pos_ < src_.size() && is_identifier_char(src_[pos_]))
            tok.value += advance();
          return tok;
        }

        tok.value = std::string(1, c);
        switch (c) {
          case '=':
            tok.kind = token_kind::eq;
            break;
          case ',':
            tok.kind = token_kind::comma;
            break;
          case '|':
            tok.kind = token_kind::pipe;
            break;
          case ';':
            tok.kind = token_kind::semicolon;
            break;
          case '-':
            tok.kind = token_kind::minus;
            break;
          case '(':
            tok.kind = token_kind::lparen;
            break;
          case ')':
            tok.kind = token_kind::rparen;
            break;
          case '[':
            tok.kind = token_kind::lbracket;
            break;
          case ']':
            tok.kind = token_kind::rbracket;
            break;
          case '{':
            tok.kind = token_kind::lbrace;
            break;
          case '}':
            tok.kind = token_kind::rbrace;
            break;
          default:
            throw grammar_syntax_error(tok.line, tok.column, "a grammar symbol",
                                       "character '" + tok.value + "'");
        }
        advance();
        return tok;
      }

    private:
      const std::string& src_;
      std::size_t pos_ = 0;
      std::size_t line_ = 1;
      std::size_t column_ = 1;

      char
      advance() {
        char c = src_[pos_++];
        if (c == '\n') {
          ++line_;
          column_ = 1;
        } else {
          ++column_;
        }
        return c;
      }

      bool
      at_comment_open() const {
        return pos_ + 1 < src_.size() && src_[pos_] == '(' &&
               src_[pos_ + 1] == '*';
      }

      void
      skip_whitespace_and_comments() {
        while (pos_ < src_.size()) {
          if (std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            advance();
          } else if (at_comment_open()) {
            skip_comment();
          } else {
            break;
          }
        }
      }

      // Comments nest: (* outer (* inner *) still outer *)
      void
      skip_comment() {
        std::size_t line = line_;
        std::size_t column = column_;
        int depth = 0;
        while (pos_ < src_.size()) {
          if (at_comment_open()) {
            advance();
            advance();
            ++depth;
          } else if (pos_ + 1 < src_.size() && src_[pos_] == '*' &&
                     src_[pos_ + 1] == ')') {
            advance();
            advance();
            if (--depth == 0) return;
          } else {
            advance();
          }
        }
        throw grammar_syntax_error(line, column, "'*)' closing the comment",
                                   "end of input");
      }

      meta_token
      read_literal(meta_token tok) {
        char quote = advance();
        tok.kind = token_kind::literal;
        while (pos_ < src_.size() && src_[pos_] != quote)
          tok.value += advance();
        if (pos_ >= src_.size())
          throw grammar_syntax_error(tok.line, tok.column,
                                     std::string("closing ") + quote,
                                     "end of input");
        advance();
        if (tok.value.empty())
          throw grammar_syntax_error(tok.line, tok.column, "a non-empty literal",
                                     "empty literal");
        return tok;
      }
    };

    // -----------------------------------------------------------------------
    // Parser
    // -----------------------------------------------------------------------

    class parser {
    public:
      explicit parser(const std::string& source) : lex_(source) { advance(); }

      grammar
      parse_grammar() {
        grammar g;
        if (current_.kind == token_kind::eof) error("a rule definition");
        while (current_.kind != token_kind::eof)
          g.add_rule(parse_rule());
        return g;
      }

    private:
      lexer lex_;
      meta_token current_;

      void
      advance() {
        current_ = lex_.next();
      }

      [[noreturn]] void
      error(const std::string& expected) {
        throw grammar_syntax_error(current_.line, current_.column, expected,
                                   describe(current_));
      }

      void
      expect(token_kind kind, const std::string& expected) {
        if (current_.kind != kind) error(expected);
        advance();
      }

      grammar_rule
      parse_rule() {
        grammar_rule rule;
        rule.line = current_.line;
        if (current_.kind != token_kind::identifier) error("a rule name");
        rule.name = current_.value;
        advance();
        expect(token_kind::eq, "'='");
        rule.alternatives = parse_alternatives();
        expect(token_kind::semicolon, "';'");
        return rule;
      }

      std::vector<alternative>
      parse_alternatives() {
        std::vector<alternative> alts;
        alts.push_back(parse_alternative());
        while (current_.kind == token_kind::pipe) {
          advance();
          alts.push_back(parse_alternative());
        }
        return alts;
      }

      alternative
      parse_alternative() {
        alternative alt;
        alt.terms.push_back(parse_factor());
        while (current_.kind == token_kind::comma) {
          advance();
          alt.terms.push_back(parse_factor());
        }
        return alt;
      }

      // term [ "-" term ]. A minus straight after '}' was already taken by
      // parse_term as the one-or-more marker, so `{ a } - b` needs the
      // repetition in parentheses.
      term
      parse_factor() {
        auto base = parse_term();
        if (current_.kind != token_kind::minus) return base;
        advance();
        auto except = parse_term();
        return term(exception_term{make_term(ungroup(std::move(base))),
                                   make_term(ungroup(std::move(except)))});
      }

      term
      parse_term() {
        switch (current_.kind) {
          case token_kind::literal: {
            auto text = current_.value;
            advance();
            return lit(std::move(text));
          }
          case token_kind::identifier: {
            auto name = current_.value;
            advance();
            return ref(std::move(name));
          }
          case token_kind::lparen: {
            advance();
            auto alts = parse_alternatives();
            expect(token_kind::rparen, "')'");
            if (alts.size() == 1)
              return term(sequence_term{std::move(alts.front().terms)});
            return term(choice_term{std::move(alts)});
          }
          case token_kind::lbracket: {
            advance();
            auto body = collapse(parse_alternatives());
            expect(token_kind::rbracket, "']'");
            return term(optional_term{make_term(std::move(body))});
          }
          case token_kind::lbrace: {
            advance();
            auto body = collapse(parse_alternatives());
            expect(token_kind::rbrace, "'}'");
            bool allow_empty = true;
            if (current_.kind == token_kind::minus) {
              advance();
              allow_empty = false;
            }
            return term(repetition_term{make_term(std::move(body)), allow_empty});
          }
          default:
            error("a literal, rule name, '(', '[' or '{'");
        }
      }

      // Parentheses around one side of an exception only delimit it.
      static term
      ungroup(term t) {
        if (!t.holds<sequence_term>()) return t;
        auto& terms = t.get<sequence_term>().terms;
        if (terms.size() == 1) return std::move(terms.front());
        return t;
      }

      // Body of [ ] and { }: a lone term stays itself.
      static term
      collapse(std::vector<alternative> alts) {
        if (alts.size() > 1) return term(choice_term{std::move(alts)});
        auto& terms = alts.front().terms;
        if (terms.size() == 1) return std::move(terms.front());
        return term(sequence_term{std::move(terms)});
      }
    };

  } // namespace

  grammar
  grammar_loader::load(const std::string& source) const {
    parser p(source);
    return p.parse_grammar();
  }

} // namespace ebnf
