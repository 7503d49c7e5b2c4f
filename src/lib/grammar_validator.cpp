#include <ebnf/grammar_validator.hpp>
#include <ebnf/lookahead_sets.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <iterator>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace ebnf {

  namespace {

    // Calls fn on t and every term nested inside it.
    void
    for_each_term(const term& t, const std::function<void(const term&)>& fn) {
      fn(t);
      std::visit(
          [&fn](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, sequence_term>) {
              for (const auto& child : node.terms)
                for_each_term(child, fn);
            } else if constexpr (std::is_same_v<T, choice_term>) {
              for (const auto& alt : node.alternatives)
                for (const auto& child : alt.terms)
                  for_each_term(child, fn);
            } else if constexpr (std::is_same_v<T, repetition_term> ||
                                 std::is_same_v<T, optional_term>) {
              if (node.body) for_each_term(*node.body, fn);
            } else if constexpr (std::is_same_v<T, exception_term>) {
              if (node.base) for_each_term(*node.base, fn);
              if (node.except) for_each_term(*node.except, fn);
            }
          },
          t.data());
    }

    void
    for_each_term(const grammar_rule& rule,
                  const std::function<void(const term&)>& fn) {
      for (const auto& alt : rule.alternatives)
        for (const auto& t : alt.terms)
          for_each_term(t, fn);
    }

    // -- 1. Uniqueness --------------------------------------------------------

    void
    check_unique_names(const grammar& g) {
      std::set<std::string> seen;
      for (const auto& r : g.rules()) {
        if (!seen.insert(r.name).second) throw duplicate_rule_error(r.name);
      }
    }

    // -- 2. Reference resolution ----------------------------------------------

    void
    check_references(const grammar& g) {
      for (const auto& r : g.rules()) {
        for_each_term(r, [&](const term& t) {
          if (!t.holds<ref_term>()) return;
          const auto& name = t.get<ref_term>().name;
          if (!g.find_rule(name)) throw undefined_rule_error(name, r.name);
        });
      }
      auto entry = g.entry();
      if (!g.find_rule(entry)) throw undefined_rule_error(entry, "");
    }

    // -- 3. Reachability ------------------------------------------------------

    void
    collect_unreachable(const grammar& g, std::vector<grammar_warning>& out) {
      std::set<std::string> reached{g.entry()};
      std::deque<std::string> pending{g.entry()};
      while (!pending.empty()) {
        const auto* rule = g.find_rule(pending.front());
        pending.pop_front();
        for_each_term(*rule, [&](const term& t) {
          if (!t.holds<ref_term>()) return;
          const auto& name = t.get<ref_term>().name;
          if (reached.insert(name).second) pending.push_back(name);
        });
      }
      for (const auto& r : g.rules()) {
        if (!reached.count(r.name))
          out.push_back({warning_kind::unreachable_rule, r.name, {}, {}});
      }
    }

    // -- 4. Left recursion ----------------------------------------------------

    class left_edges {
      const lookahead_sets& sets_;

    public:
      explicit left_edges(const lookahead_sets& sets) : sets_(sets) {}

      // Rules a match of `terms` may begin with, before consuming input.
      void
      of_terms(const std::vector<term>& terms, std::vector<std::string>& out) {
        for (const auto& t : terms) {
          of_term(t, out);
          if (!sets_.nullable(t)) return;
        }
      }

      void
      of_term(const term& t, std::vector<std::string>& out) {
        std::visit(
            [&](const auto& node) {
              using T = std::decay_t<decltype(node)>;
              if constexpr (std::is_same_v<T, ref_term>) {
                if (std::find(out.begin(), out.end(), node.name) == out.end())
                  out.push_back(node.name);
              } else if constexpr (std::is_same_v<T, sequence_term>) {
                of_terms(node.terms, out);
              } else if constexpr (std::is_same_v<T, choice_term>) {
                for (const auto& alt : node.alternatives)
                  of_terms(alt.terms, out);
              } else if constexpr (std::is_same_v<T, repetition_term> ||
                                   std::is_same_v<T, optional_term>) {
                of_term(*node.body, out);
              } else if constexpr (std::is_same_v<T, exception_term>) {
                // The exception is tried where the base starts.
                of_term(*node.base, out);
                of_term(*node.except, out);
              }
            },
            t.data());
      }
    };

    enum class mark { unvisited, active, done };

    class cycle_finder {
      const std::unordered_map<std::string, std::vector<std::string>>& edges_;
      std::unordered_map<std::string, mark> marks_;
      std::vector<std::string> stack_;

    public:
      explicit cycle_finder(
          const std::unordered_map<std::string, std::vector<std::string>>&
              edges)
          : edges_(edges) {}

      void
      visit(const std::string& rule) {
        auto& m = marks_[rule];
        if (m == mark::done) return;
        if (m == mark::active) {
          auto start = std::find(stack_.begin(), stack_.end(), rule);
          throw left_recursion_error(
              std::vector<std::string>(start, stack_.end()));
        }
        m = mark::active;
        stack_.push_back(rule);
        auto it = edges_.find(rule);
        if (it != edges_.end()) {
          for (const auto& next : it->second)
            visit(next);
        }
        stack_.pop_back();
        marks_[rule] = mark::done;
      }
    };

    void
    check_left_recursion(const grammar& g, const lookahead_sets& sets) {
      std::unordered_map<std::string, std::vector<std::string>> edges;
      left_edges collect(sets);
      for (const auto& r : g.rules()) {
        auto& out = edges[r.name];
        for (const auto& alt : r.alternatives)
          collect.of_terms(alt.terms, out);
      }
      cycle_finder finder(edges);
      for (const auto& r : g.rules())
        finder.visit(r.name);
    }

    // -- 5. Repetitions that can match nothing --------------------------------

    void
    check_repetitions(const grammar& g, const lookahead_sets& sets) {
      for (const auto& r : g.rules()) {
        for_each_term(r, [&](const term& t) {
          if (!t.holds<repetition_term>()) return;
          if (sets.nullable(*t.get<repetition_term>().body))
            throw infinite_loop_error(r.name);
        });
      }
    }

    // -- 6. Ambiguity ---------------------------------------------------------

    void
    check_overlap(const std::string& rule,
                  const std::vector<alternative>& alts,
                  const lookahead_sets& sets,
                  std::vector<grammar_warning>& out) {
      std::vector<terminal_set> firsts;
      for (const auto& alt : alts)
        firsts.push_back(sets.first(alt));
      for (std::size_t i = 0; i < firsts.size(); ++i) {
        for (std::size_t j = i + 1; j < firsts.size(); ++j) {
          std::vector<std::string> overlap;
          std::set_intersection(firsts[i].begin(), firsts[i].end(),
                                firsts[j].begin(), firsts[j].end(),
                                std::back_inserter(overlap));
          if (!overlap.empty())
            out.push_back({warning_kind::ambiguity, rule, {i, j},
                           std::move(overlap)});
        }
      }
    }

    void
    collect_ambiguities(const grammar& g, const lookahead_sets& sets,
                        std::vector<grammar_warning>& out) {
      for (const auto& r : g.rules()) {
        check_overlap(r.name, r.alternatives, sets, out);
        for_each_term(r, [&](const term& t) {
          if (t.holds<choice_term>())
            check_overlap(r.name, t.get<choice_term>().alternatives, sets, out);
        });
      }
    }

  } // namespace

  validation_result
  grammar_validator::validate(const grammar& g) const {
    validation_result result;

    check_unique_names(g);
    check_references(g);
    collect_unreachable(g, result.warnings);

    auto sets = compute_lookahead_sets(g);
    check_left_recursion(g, sets);
    check_repetitions(g, sets);
    collect_ambiguities(g, sets, result.warnings);

    return result;
  }

} // namespace ebnf
