#include <ebnf/lookahead_sets.hpp>

#include <type_traits>
#include <vector>

namespace ebnf {

  namespace {

    bool
    merge_into(terminal_set& target, const terminal_set& source) {
      bool grew = false;
      for (const auto& t : source) {
        if (target.insert(t).second) grew = true;
      }
      return grew;
    }

    // FIRST and nullable of a run of terms taken in order.
    void
    scan_terms(const lookahead_sets& sets, const std::vector<term>& terms,
               terminal_set& first, bool& nullable) {
      nullable = true;
      for (const auto& t : terms) {
        merge_into(first, sets.first(t));
        if (!sets.nullable(t)) {
          nullable = false;
          return;
        }
      }
    }

    class follow_propagator {
      const lookahead_sets& sets_;
      std::unordered_map<std::string, terminal_set>& follow_;
      bool changed_ = false;

    public:
      follow_propagator(const lookahead_sets& sets,
                        std::unordered_map<std::string, terminal_set>& follow)
          : sets_(sets), follow_(follow) {}

      bool
      changed() const {
        return changed_;
      }

      void
      terms(const std::vector<term>& ts, const terminal_set& after) {
        terminal_set trailer = after;
        for (auto it = ts.rbegin(); it != ts.rend(); ++it) {
          visit(*it, trailer);
          terminal_set next = sets_.first(*it);
          if (sets_.nullable(*it)) merge_into(next, trailer);
          trailer = std::move(next);
        }
      }

      void
      visit(const term& t, const terminal_set& after) {
        std::visit(
            [&](const auto& node) {
              using T = std::decay_t<decltype(node)>;
              if constexpr (std::is_same_v<T, ref_term>) {
                if (merge_into(follow_[node.name], after)) changed_ = true;
              } else if constexpr (std::is_same_v<T, sequence_term>) {
                terms(node.terms, after);
              } else if constexpr (std::is_same_v<T, choice_term>) {
                for (const auto& alt : node.alternatives)
                  terms(alt.terms, after);
              } else if constexpr (std::is_same_v<T, repetition_term>) {
                // Another iteration may follow the body.
                terminal_set looped = after;
                merge_into(looped, sets_.first(*node.body));
                visit(*node.body, looped);
              } else if constexpr (std::is_same_v<T, optional_term>) {
                visit(*node.body, after);
              } else if constexpr (std::is_same_v<T, exception_term>) {
                visit(*node.base, after);
              }
            },
            t.data());
      }
    };

  } // namespace

  bool
  lookahead_sets::nullable(const std::string& rule) const {
    auto it = nullable_.find(rule);
    return it != nullable_.end() && it->second;
  }

  bool
  lookahead_sets::nullable(const alternative& alt) const {
    for (const auto& t : alt.terms) {
      if (!nullable(t)) return false;
    }
    return true;
  }

  bool
  lookahead_sets::nullable(const term& t) const {
    return std::visit(
        [this](const auto& node) -> bool {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_term>) {
            return false;
          } else if constexpr (std::is_same_v<T, ref_term>) {
            return nullable(node.name);
          } else if constexpr (std::is_same_v<T, sequence_term>) {
            for (const auto& child : node.terms) {
              if (!nullable(child)) return false;
            }
            return true;
          } else if constexpr (std::is_same_v<T, choice_term>) {
            for (const auto& alt : node.alternatives) {
              if (nullable(alt)) return true;
            }
            return false;
          } else if constexpr (std::is_same_v<T, repetition_term>) {
            return node.allow_empty || nullable(*node.body);
          } else if constexpr (std::is_same_v<T, exception_term>) {
            return nullable(*node.base);
          } else {
            return true;
          }
        },
        t.data());
  }

  terminal_set
  lookahead_sets::first(const std::string& rule) const {
    auto it = first_.find(rule);
    if (it == first_.end()) return {};
    return it->second;
  }

  terminal_set
  lookahead_sets::first(const alternative& alt) const {
    terminal_set result;
    bool all_nullable = true;
    scan_terms(*this, alt.terms, result, all_nullable);
    return result;
  }

  terminal_set
  lookahead_sets::first(const term& t) const {
    return std::visit(
        [this](const auto& node) -> terminal_set {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_term>) {
            return {node.text};
          } else if constexpr (std::is_same_v<T, ref_term>) {
            return first(node.name);
          } else if constexpr (std::is_same_v<T, sequence_term>) {
            terminal_set result;
            bool all_nullable = true;
            scan_terms(*this, node.terms, result, all_nullable);
            return result;
          } else if constexpr (std::is_same_v<T, choice_term>) {
            terminal_set result;
            for (const auto& alt : node.alternatives)
              merge_into(result, first(alt));
            return result;
          } else if constexpr (std::is_same_v<T, exception_term>) {
            return first(*node.base);
          } else {
            return first(*node.body);
          }
        },
        t.data());
  }

  terminal_set
  lookahead_sets::follow(const std::string& rule) const {
    auto it = follow_.find(rule);
    if (it == follow_.end()) return {};
    return it->second;
  }

  lookahead_sets
  compute_lookahead_sets(const grammar& g) {
    lookahead_sets sets;

    // Nullable and FIRST grow monotonically; stop once a pass adds nothing.
    bool changed = true;
    while (changed) {
      changed = false;
      for (const auto& r : g.rules()) {
        bool rule_nullable = false;
        terminal_set rule_first;
        for (const auto& alt : r.alternatives) {
          if (sets.nullable(alt)) rule_nullable = true;
          merge_into(rule_first, sets.first(alt));
        }
        if (rule_nullable && !sets.nullable(r.name)) {
          sets.nullable_[r.name] = true;
          changed = true;
        }
        if (merge_into(sets.first_[r.name], rule_first)) changed = true;
      }
    }

    std::string entry = g.entry();
    if (!entry.empty()) sets.follow_[entry].insert(end_marker);

    changed = true;
    while (changed) {
      follow_propagator propagate(sets, sets.follow_);
      for (const auto& r : g.rules()) {
        terminal_set after = sets.follow(r.name);
        for (const auto& alt : r.alternatives)
          propagate.terms(alt.terms, after);
      }
      changed = propagate.changed();
    }

    return sets;
  }

} // namespace ebnf
