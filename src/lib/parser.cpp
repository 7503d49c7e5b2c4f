#include <ebnf/errors.hpp>
#include <ebnf/parser.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace ebnf {

  namespace {

    // One parse call: cursor, depth and furthest failure live here, never in
    // the shared model.
    class engine {
      const parser_model& model_;
      const std::vector<token>& tokens_;
      std::vector<std::optional<terminal_id>> ids_;
      std::size_t max_depth_;
      std::size_t depth_ = 0;

      std::size_t furthest_ = 0;
      terminal_id_set expected_;

    public:
      engine(const parser_model& model, const std::vector<token>& tokens,
             const parser_options& options)
          : model_(model), tokens_(tokens), max_depth_(options.max_depth) {
        ids_.reserve(tokens.size());
        for (const auto& tok : tokens)
          ids_.push_back(model.find_terminal(tok.text));
      }

      syntax_node
      run(rule_id rule) {
        std::size_t pos = 0;
        std::vector<syntax_node> out;
        if (!call(rule, pos, out)) throw syntax_error();
        if (pos < tokens_.size()) throw trailing_input_error(tokens_[pos]);
        return std::move(out.front());
      }

    private:
      source_position
      position_at(std::size_t pos) const {
        if (pos < tokens_.size()) return tokens_[pos].position;
        return end_position(tokens_);
      }

      parse_syntax_error
      syntax_error() const {
        std::vector<std::string> expected = model_.texts(expected_);
        std::sort(expected.begin(), expected.end());
        if (furthest_ < tokens_.size())
          return parse_syntax_error(std::move(expected), tokens_[furthest_]);
        return parse_syntax_error(
            std::move(expected),
            token{end_of_input_kind, "", end_position(tokens_)});
      }

      void
      fail_at(std::size_t pos, const terminal_id_set& expected) {
        if (pos > furthest_) {
          furthest_ = pos;
          expected_ = expected;
        } else if (pos == furthest_) {
          expected_.insert(expected.begin(), expected.end());
        }
      }

      bool
      starts_with(std::size_t pos, const terminal_id_set& first) const {
        return pos < ids_.size() && ids_[pos] && first.count(*ids_[pos]) > 0;
      }

      static void
      truncate(std::vector<syntax_node>& out, std::size_t mark) {
        out.erase(out.begin() + static_cast<std::ptrdiff_t>(mark), out.end());
      }

      bool
      call(rule_id id, std::size_t& pos, std::vector<syntax_node>& out) {
        if (depth_ >= max_depth_)
          throw recursion_depth_exceeded_error(max_depth_, position_at(pos));
        const auto& rule = model_.rule(id);
        ++depth_;
        std::vector<syntax_node> children;
        bool ok = match(rule.body, pos, children);
        --depth_;
        if (!ok) return false;
        out.push_back(syntax_node::make_rule(rule.name, std::move(children)));
        return true;
      }

      // On failure pos and out are left as they were on entry.
      bool
      match(const model_node& node, std::size_t& pos,
            std::vector<syntax_node>& out) {
        switch (node.op) {
          case node_op::literal:
            if (pos < ids_.size() && ids_[pos] == node.terminal) {
              out.push_back(syntax_node::make_leaf(tokens_[pos]));
              ++pos;
              return true;
            }
            fail_at(pos, node.first);
            return false;

          case node_op::call:
            return call(node.rule, pos, out);

          case node_op::sequence: {
            std::size_t start = pos;
            std::size_t mark = out.size();
            for (const auto& child : node.children) {
              if (!match(child, pos, out)) {
                pos = start;
                truncate(out, mark);
                return false;
              }
            }
            return true;
          }

          case node_op::choice:
            return match_choice(node, pos, out);

          case node_op::repetition:
            return match_repetition(node, pos, out);

          case node_op::optional: {
            const auto& body = node.children.front();
            if (body.nullable || starts_with(pos, body.first)) {
              std::vector<syntax_node> children;
              if (match(body, pos, children)) {
                out.push_back(syntax_node::make_optional(std::move(children)));
                return true;
              }
            } else {
              fail_at(pos, body.first);
            }
            out.push_back(syntax_node::make_absent());
            return true;
          }

          case node_op::exception:
            return match_exception(node, pos, out);
        }
        return false;
      }

      // The excluded form is matched on a scratch cursor, and its failures
      // are not reported.
      bool
      match_exception(const model_node& node, std::size_t& pos,
                      std::vector<syntax_node>& out) {
        const auto& base = node.children[0];
        const auto& except = node.children[1];

        std::size_t furthest = furthest_;
        terminal_id_set expected = expected_;
        std::size_t scratch_pos = pos;
        std::vector<syntax_node> scratch;
        bool excluded = match(except, scratch_pos, scratch);
        furthest_ = furthest;
        expected_ = std::move(expected);

        if (!excluded) return match(base, pos, out);

        terminal_id_set allowed;
        for (auto id : base.first) {
          if (!except.first.count(id)) allowed.insert(id);
        }
        fail_at(pos, allowed.empty() ? base.first : allowed);
        return false;
      }

      bool
      match_choice(const model_node& node, std::size_t& pos,
                   std::vector<syntax_node>& out) {
        if (node.strategy == choice_strategy::predictive) {
          if (pos < ids_.size() && ids_[pos]) {
            auto it = node.dispatch.find(*ids_[pos]);
            if (it != node.dispatch.end())
              return match(node.children[it->second], pos, out);
          }
          fail_at(pos, node.first);
          return false;
        }

        for (const auto& alt : node.children) {
          if (!alt.nullable && !starts_with(pos, alt.first)) {
            fail_at(pos, alt.first);
            continue;
          }
          if (match(alt, pos, out)) return true;
        }
        return false;
      }

      // Greedy: no iteration is ever given back to a later term.
      bool
      match_repetition(const model_node& node, std::size_t& pos,
                       std::vector<syntax_node>& out) {
        const auto& body = node.children.front();
        std::vector<syntax_node> groups;
        while (true) {
          if (!starts_with(pos, body.first)) {
            fail_at(pos, body.first);
            break;
          }
          std::size_t start = pos;
          std::vector<syntax_node> children;
          if (!match(body, pos, children)) break;
          if (pos == start) break;
          groups.push_back(syntax_node::make_group(std::move(children)));
        }
        if (!node.allow_empty && groups.empty()) return false;
        out.push_back(syntax_node::make_repetition(std::move(groups)));
        return true;
      }
    };

    syntax_node
    run(const parser_model& model, rule_id rule,
        const std::vector<token>& tokens, const parser_options& options) {
      engine e(model, tokens, options);
      return e.run(rule);
    }

  } // namespace

  syntax_node
  rule_procedure::operator()(const std::vector<token>& tokens) const {
    return run(*model_, rule_, tokens, options_);
  }

  syntax_node
  rule_procedure::operator()(const std::vector<token>& tokens,
                             const parser_options& options) const {
    return run(*model_, rule_, tokens, options);
  }

  grammar_parser::grammar_parser(std::shared_ptr<const parser_model> model,
                                 parser_options options)
      : model_(std::move(model)), options_(options) {
    if (!model_) throw std::invalid_argument("grammar_parser: null model");
  }

  syntax_node
  grammar_parser::parse(const std::vector<token>& tokens) const {
    return run(*model_, model_->entry(), tokens, options_);
  }

  syntax_node
  grammar_parser::parse(const std::vector<token>& tokens,
                        const parser_options& options) const {
    return run(*model_, model_->entry(), tokens, options);
  }

  syntax_node
  grammar_parser::parse(token_source& source) const {
    return parse(drain(source));
  }

  rule_procedure
  grammar_parser::rule(const std::string& name) const {
    auto id = model_->find_rule(name);
    if (!id) throw std::invalid_argument("grammar_parser: no rule '" + name + "'");
    return rule_procedure(model_, *id, options_);
  }

  bool
  grammar_parser::has_rule(const std::string& name) const {
    return model_->find_rule(name).has_value();
  }

  std::vector<std::string>
  grammar_parser::rule_names() const {
    std::vector<std::string> names;
    for (const auto& r : model_->rules())
      names.push_back(r.name);
    return names;
  }

  const std::string&
  grammar_parser::entry_rule() const {
    return model_->rule(model_->entry()).name;
  }

  grammar_parser
  emit(parser_model model, parser_options options) {
    return grammar_parser(
        std::make_shared<const parser_model>(std::move(model)), options);
  }

} // namespace ebnf
