#include <ebnf/errors.hpp>
#include <ebnf/parser_model.hpp>

#include <type_traits>
#include <variant>

namespace ebnf {

  namespace {

    class lowering {
      const lookahead_sets& sets_;
      std::vector<std::string>& terminals_;
      std::unordered_map<std::string, terminal_id>& terminal_ids_;
      const std::unordered_map<std::string, rule_id>& rule_ids_;

    public:
      lowering(const lookahead_sets& sets, std::vector<std::string>& terminals,
               std::unordered_map<std::string, terminal_id>& terminal_ids,
               const std::unordered_map<std::string, rule_id>& rule_ids)
          : sets_(sets), terminals_(terminals), terminal_ids_(terminal_ids),
            rule_ids_(rule_ids) {}

      terminal_id
      intern(const std::string& text) {
        auto it = terminal_ids_.find(text);
        if (it != terminal_ids_.end()) return it->second;
        auto id = static_cast<terminal_id>(terminals_.size());
        terminals_.push_back(text);
        terminal_ids_.emplace(text, id);
        return id;
      }

      terminal_id_set
      intern(const terminal_set& texts) {
        terminal_id_set ids;
        for (const auto& t : texts) {
          if (t != end_marker) ids.insert(intern(t));
        }
        return ids;
      }

      model_node
      alternatives(const std::vector<alternative>& alts) {
        if (alts.size() == 1) return terms(alts.front().terms);
        model_node node;
        node.op = node_op::choice;
        for (const auto& alt : alts)
          node.children.push_back(terms(alt.terms));
        plan(node);
        return node;
      }

      model_node
      terms(const std::vector<term>& ts) {
        if (ts.size() == 1) return lower(ts.front());
        model_node node;
        node.op = node_op::sequence;
        for (const auto& t : ts)
          node.children.push_back(lower(t));
        annotate_sequence(node);
        return node;
      }

      model_node
      lower(const term& t) {
        return std::visit(
            [this](const auto& n) -> model_node {
              using T = std::decay_t<decltype(n)>;
              model_node node;
              if constexpr (std::is_same_v<T, literal_term>) {
                node.op = node_op::literal;
                node.terminal = intern(n.text);
                node.first = {node.terminal};
              } else if constexpr (std::is_same_v<T, ref_term>) {
                node.op = node_op::call;
                auto it = rule_ids_.find(n.name);
                if (it == rule_ids_.end())
                  throw undefined_rule_error(n.name, "");
                node.rule = it->second;
                node.first = intern(sets_.first(n.name));
                node.nullable = sets_.nullable(n.name);
              } else if constexpr (std::is_same_v<T, sequence_term>) {
                node.op = node_op::sequence;
                for (const auto& child : n.terms)
                  node.children.push_back(lower(child));
                annotate_sequence(node);
              } else if constexpr (std::is_same_v<T, choice_term>) {
                node = alternatives(n.alternatives);
              } else if constexpr (std::is_same_v<T, repetition_term>) {
                node.op = node_op::repetition;
                node.allow_empty = n.allow_empty;
                node.children.push_back(lower(*n.body));
                node.first = node.children.front().first;
                node.nullable = n.allow_empty || node.children.front().nullable;
              } else if constexpr (std::is_same_v<T, exception_term>) {
                node.op = node_op::exception;
                node.children.push_back(lower(*n.base));
                node.children.push_back(lower(*n.except));
                node.first = node.children.front().first;
                node.nullable = node.children.front().nullable;
              } else {
                node.op = node_op::optional;
                node.children.push_back(lower(*n.body));
                node.first = node.children.front().first;
                node.nullable = true;
              }
              return node;
            },
            t.data());
      }

    private:
      static void
      annotate_sequence(model_node& node) {
        node.nullable = true;
        for (const auto& child : node.children) {
          node.first.insert(child.first.begin(), child.first.end());
          if (!child.nullable) {
            node.nullable = false;
            return;
          }
        }
      }

      static void
      plan(model_node& node) {
        bool predictive = true;
        for (std::size_t i = 0; i < node.children.size(); ++i) {
          const auto& alt = node.children[i];
          node.first.insert(alt.first.begin(), alt.first.end());
          if (alt.nullable) {
            node.nullable = true;
            predictive = false;
          }
          for (auto t : alt.first) {
            if (!node.dispatch.emplace(t, i).second) predictive = false;
          }
        }
        if (predictive) {
          node.strategy = choice_strategy::predictive;
        } else {
          node.strategy = choice_strategy::ordered;
          node.dispatch.clear();
        }
      }
    };

  } // namespace

  std::optional<terminal_id>
  parser_model::find_terminal(const std::string& text) const {
    auto it = terminal_ids_.find(text);
    if (it == terminal_ids_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<rule_id>
  parser_model::find_rule(const std::string& name) const {
    auto it = rule_ids_.find(name);
    if (it == rule_ids_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<std::string>
  parser_model::texts(const terminal_id_set& ids) const {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (auto id : ids)
      out.push_back(terminals_.at(id));
    return out;
  }

  parser_model
  build_model(const grammar& g) {
    parser_model model;
    auto sets = compute_lookahead_sets(g);

    for (const auto& r : g.rules()) {
      auto id = static_cast<rule_id>(model.rules_.size());
      model.rule_ids_.emplace(r.name, id);
      model.rules_.push_back(model_rule{r.name, {}, {}, {}, false, false});
    }

    auto entry = model.rule_ids_.find(g.entry());
    if (entry == model.rule_ids_.end())
      throw undefined_rule_error(g.entry(), "");
    model.entry_ = entry->second;

    lowering lower(sets, model.terminals_, model.terminal_ids_,
                   model.rule_ids_);
    for (std::size_t i = 0; i < g.rules().size(); ++i) {
      const auto& r = g.rules()[i];
      auto& target = model.rules_[i];
      target.body = lower.alternatives(r.alternatives);
      target.first = lower.intern(sets.first(r.name));
      target.nullable = sets.nullable(r.name);
      auto follow = sets.follow(r.name);
      target.follow_end = follow.count(end_marker) > 0;
      target.follow = lower.intern(follow);
    }

    return model;
  }

} // namespace ebnf
