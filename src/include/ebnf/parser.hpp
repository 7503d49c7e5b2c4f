#pragma once

#include <ebnf/parser_model.hpp>
#include <ebnf/syntax_tree.hpp>
#include <ebnf/token.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ebnf {

  struct parser_options {
    // Maximum number of nested rule invocations in one parse.
    std::size_t max_depth = 512;
  };

  // Parsing procedure for one rule. Invoked on a whole token sequence; the
  // rule must match all of it.
  class rule_procedure {
    std::shared_ptr<const parser_model> model_;
    rule_id rule_;
    parser_options options_;

  public:
    rule_procedure(std::shared_ptr<const parser_model> model, rule_id rule,
                   parser_options options)
        : model_(std::move(model)), rule_(rule), options_(options) {}

    const std::string&
    name() const {
      return model_->rule(rule_).name;
    }

    syntax_node
    operator()(const std::vector<token>& tokens) const;

    syntax_node
    operator()(const std::vector<token>& tokens,
               const parser_options& options) const;
  };

  // Reusable parser produced by emit(). Holds no mutable state; concurrent
  // parse calls on one instance are safe.
  class grammar_parser {
    std::shared_ptr<const parser_model> model_;
    parser_options options_;

  public:
    explicit grammar_parser(std::shared_ptr<const parser_model> model,
                            parser_options options = {});

    // Entry procedure.
    syntax_node
    parse(const std::vector<token>& tokens) const;

    syntax_node
    parse(const std::vector<token>& tokens,
          const parser_options& options) const;

    syntax_node
    parse(token_source& source) const;

    // Procedure for a named rule; throws std::invalid_argument for an
    // unknown name.
    rule_procedure
    rule(const std::string& name) const;

    bool
    has_rule(const std::string& name) const;

    std::vector<std::string>
    rule_names() const;

    const std::string&
    entry_rule() const;

    const parser_model&
    model() const {
      return *model_;
    }

    const parser_options&
    options() const {
      return options_;
    }
  };

  grammar_parser
  emit(parser_model model, parser_options options = {});

} // namespace ebnf
