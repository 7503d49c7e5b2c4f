#include <ebnf/grammar.hpp>

#include <type_traits>

namespace ebnf {

  namespace {

    bool
    same_body(const std::unique_ptr<term>& a, const std::unique_ptr<term>& b) {
      if (!a && !b) return true;
      if (!a || !b) return false;
      return *a == *b;
    }

  } // namespace

  bool
  alternative::operator==(const alternative& other) const {
    if (terms.size() != other.terms.size()) return false;
    for (std::size_t i = 0; i < terms.size(); ++i) {
      if (!(terms[i] == other.terms[i])) return false;
    }
    return true;
  }

  bool
  term::operator==(const term& other) const {
    return std::visit(
        [](const auto& a, const auto& b) -> bool {
          using A = std::decay_t<decltype(a)>;
          using B = std::decay_t<decltype(b)>;

          if constexpr (!std::is_same_v<A, B>) {
            return false;
          } else if constexpr (std::is_same_v<A, literal_term>) {
            return a.text == b.text;
          } else if constexpr (std::is_same_v<A, ref_term>) {
            return a.name == b.name;
          } else if constexpr (std::is_same_v<A, sequence_term>) {
            if (a.terms.size() != b.terms.size()) return false;
            for (std::size_t i = 0; i < a.terms.size(); ++i) {
              if (!(a.terms[i] == b.terms[i])) return false;
            }
            return true;
          } else if constexpr (std::is_same_v<A, choice_term>) {
            return a.alternatives == b.alternatives;
          } else if constexpr (std::is_same_v<A, repetition_term>) {
            return a.allow_empty == b.allow_empty && same_body(a.body, b.body);
          } else if constexpr (std::is_same_v<A, exception_term>) {
            return same_body(a.base, b.base) && same_body(a.except, b.except);
          } else {
            return same_body(a.body, b.body);
          }
        },
        data_, other.data_);
  }

  bool
  grammar_rule::operator==(const grammar_rule& other) const {
    // Source lines are bookkeeping, not structure.
    return name == other.name && alternatives == other.alternatives;
  }

  const grammar_rule*
  grammar::find_rule(const std::string& name) const {
    for (const auto& r : rules_) {
      if (r.name == name) return &r;
    }
    return nullptr;
  }

  std::string
  grammar::entry() const {
    if (!entry_.empty()) return entry_;
    if (rules_.empty()) return {};
    return rules_.front().name;
  }

  bool
  grammar::operator==(const grammar& other) const {
    return rules_ == other.rules_;
  }

} // namespace ebnf
