#pragma once

#include <ebnf/grammar.hpp>
#include <ebnf/lookahead_sets.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ebnf {

  using terminal_id = std::uint32_t;
  using rule_id = std::uint32_t;

  using terminal_id_set = std::set<terminal_id>;

  // -- Operational nodes --------------------------------------------------------

  enum class node_op {
    literal,
    call,
    sequence,
    choice,
    repetition,
    optional,
    // children are [base, except]
    exception,
  };

  enum class choice_strategy {
    // One alternative chosen by the next token.
    predictive,
    // Alternatives tried in declared order; the first success is kept.
    ordered,
  };

  struct model_node {
    node_op op = node_op::sequence;
    terminal_id terminal = 0;          // literal
    rule_id rule = 0;                  // call
    std::vector<model_node> children;  // sequence items, choice alternatives,
                                       // repetition/optional body (one child)
    bool allow_empty = true;           // repetition
    choice_strategy strategy = choice_strategy::ordered;
    std::unordered_map<terminal_id, std::size_t> dispatch; // predictive choice

    terminal_id_set first;
    bool nullable = false;
  };

  struct model_rule {
    std::string name;
    model_node body;
    terminal_id_set first;
    terminal_id_set follow;
    bool nullable = false;
    // FOLLOW contains the end of input.
    bool follow_end = false;
  };

  // -- Model --------------------------------------------------------------------

  class parser_model {
    std::vector<std::string> terminals_;
    std::unordered_map<std::string, terminal_id> terminal_ids_;
    std::vector<model_rule> rules_;
    std::unordered_map<std::string, rule_id> rule_ids_;
    rule_id entry_ = 0;

    friend parser_model
    build_model(const grammar& g);

  public:
    const std::vector<std::string>&
    terminals() const {
      return terminals_;
    }

    const std::string&
    terminal_text(terminal_id id) const {
      return terminals_.at(id);
    }

    std::optional<terminal_id>
    find_terminal(const std::string& text) const;

    const std::vector<model_rule>&
    rules() const {
      return rules_;
    }

    const model_rule&
    rule(rule_id id) const {
      return rules_.at(id);
    }

    std::optional<rule_id>
    find_rule(const std::string& name) const;

    rule_id
    entry() const {
      return entry_;
    }

    // Terminal texts of a set, in id order.
    std::vector<std::string>
    texts(const terminal_id_set& ids) const;
  };

  // Lowers a validated grammar to the operational model: interned terminals
  // and rules, FIRST/FOLLOW/nullable annotations, and a decision plan for
  // every choice. Choices whose alternatives have pairwise disjoint FIRST
  // sets and are all non-nullable dispatch on one token; all others try
  // alternatives in declared order.
  parser_model
  build_model(const grammar& g);

} // namespace ebnf
