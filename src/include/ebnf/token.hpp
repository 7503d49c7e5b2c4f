#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ebnf {

  struct source_position {
    std::size_t line = 1;
    std::size_t column = 1;
    std::size_t offset = 0;

    bool
    operator==(const source_position&) const = default;
  };

  std::ostream&
  operator<<(std::ostream& os, const source_position& pos);

  struct token {
    std::string kind;
    std::string text;
    source_position position;

    bool
    operator==(const token&) const = default;
  };

  // Position just past the last token, or the origin for an empty stream.
  source_position
  end_position(const std::vector<token>& tokens);

  // Forward-only token stream supplied by a lexer.
  class token_source {
  public:
    virtual ~token_source() = default;

    virtual std::optional<token>
    next() = 0;
  };

  class vector_token_source : public token_source {
    std::vector<token> tokens_;
    std::size_t index_ = 0;

  public:
    explicit vector_token_source(std::vector<token> tokens)
        : tokens_(std::move(tokens)) {}

    std::optional<token>
    next() override {
      if (index_ >= tokens_.size()) return std::nullopt;
      return tokens_[index_++];
    }
  };

  std::vector<token>
  drain(token_source& source);

} // namespace ebnf
