#pragma once

#include <ebnf/token.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ebnf {

  enum class node_kind {
    rule,       // match of a named rule
    token,      // one matched literal
    repetition, // { ... }: one group per iteration
    group,      // children of one repetition iteration
    optional,   // [ ... ]: present or absent
  };

  // Immutable parse tree node. Sequences and choices do not appear in the
  // tree; their matches are spliced into the enclosing node.
  class syntax_node {
    node_kind kind_ = node_kind::rule;
    std::string tag_;
    std::optional<token> token_;
    std::vector<syntax_node> children_;
    bool present_ = true;

    syntax_node(node_kind kind, std::string tag,
                std::vector<syntax_node> children)
        : kind_(kind), tag_(std::move(tag)), children_(std::move(children)) {}

  public:
    static syntax_node
    make_rule(std::string name, std::vector<syntax_node> children);

    static syntax_node
    make_leaf(token tok);

    static syntax_node
    make_repetition(std::vector<syntax_node> groups);

    static syntax_node
    make_group(std::vector<syntax_node> children);

    static syntax_node
    make_optional(std::vector<syntax_node> children);

    static syntax_node
    make_absent();

    node_kind
    kind() const {
      return kind_;
    }

    bool
    is_rule() const {
      return kind_ == node_kind::rule;
    }

    bool
    is_token() const {
      return kind_ == node_kind::token;
    }

    // Rule name for rule nodes, literal text for token nodes, empty
    // otherwise.
    const std::string&
    tag() const {
      return tag_;
    }

    const std::vector<syntax_node>&
    children() const {
      return children_;
    }

    // The matched token; throws std::logic_error unless is_token().
    const token&
    leaf() const;

    // False only for an optional that matched nothing.
    bool
    present() const {
      return present_;
    }

    // Concatenated text of every token below this node.
    std::string
    text() const;

    // Token texts below this node separated by single spaces.
    std::string
    source() const;

    // First direct child that is a rule node tagged `name`, looking through
    // repetitions, groups and optionals.
    const syntax_node*
    child(std::string_view name) const;

    // First rule node tagged `name` in depth-first order, this node
    // excluded.
    const syntax_node*
    find(std::string_view name) const;

    // Rule children, looking through repetitions, groups and optionals.
    std::vector<const syntax_node*>
    rule_children() const;

    bool
    operator==(const syntax_node&) const = default;
  };

  // S-expression form: (rule ...), "token", {<iteration> ...}, [present],
  // [] for an absent optional.
  std::ostream&
  operator<<(std::ostream& os, const syntax_node& node);

} // namespace ebnf
