#include <ebnf/left_recursion.hpp>
#include <ebnf/lookahead_sets.hpp>

#include <algorithm>

namespace ebnf {

  namespace {

    // `( a , b )` written as a whole alternative reads as `a , b`.
    std::vector<term>&
    leading_terms(alternative& alt) {
      if (alt.terms.size() == 1 && alt.terms.front().holds<sequence_term>())
        return alt.terms.front().get<sequence_term>().terms;
      return alt.terms;
    }

    bool
    starts_with_self(alternative& alt, const std::string& name) {
      auto& terms = leading_terms(alt);
      return !terms.empty() && terms.front().holds<ref_term>() &&
             terms.front().get<ref_term>().name == name;
    }

    // True when everything after the leading self reference can match
    // nothing, which would turn the tail repetition into an empty loop.
    bool
    tail_nullable(alternative& alt, const lookahead_sets& sets) {
      auto& terms = leading_terms(alt);
      for (std::size_t j = 1; j < terms.size(); ++j) {
        if (!sets.nullable(terms[j])) return false;
      }
      return true;
    }

    term
    group(std::vector<alternative> alts) {
      if (alts.size() > 1) return term(choice_term{std::move(alts)});
      auto& terms = alts.front().terms;
      if (terms.size() == 1) return std::move(terms.front());
      return term(sequence_term{std::move(terms)});
    }

    void
    rewrite(grammar_rule& rule, const lookahead_sets& sets) {
      std::vector<std::size_t> recursive;
      for (std::size_t i = 0; i < rule.alternatives.size(); ++i) {
        if (starts_with_self(rule.alternatives[i], rule.name))
          recursive.push_back(i);
      }
      if (recursive.empty()) return;
      if (recursive.size() == rule.alternatives.size()) return;
      for (auto i : recursive) {
        auto& alt = rule.alternatives[i];
        if (leading_terms(alt).size() < 2 || tail_nullable(alt, sets)) return;
      }

      std::vector<alternative> base;
      std::vector<alternative> tails;
      for (std::size_t i = 0; i < rule.alternatives.size(); ++i) {
        auto& alt = rule.alternatives[i];
        if (std::find(recursive.begin(), recursive.end(), i) ==
            recursive.end()) {
          base.push_back(std::move(alt));
          continue;
        }
        auto& terms = leading_terms(alt);
        alternative tail;
        for (std::size_t j = 1; j < terms.size(); ++j)
          tail.terms.push_back(std::move(terms[j]));
        tails.push_back(std::move(tail));
      }

      alternative rewritten;
      if (base.size() == 1)
        rewritten.terms = std::move(base.front().terms);
      else
        rewritten.terms.push_back(group(std::move(base)));
      rewritten.terms.push_back(
          term(repetition_term{make_term(group(std::move(tails))), true}));

      rule.alternatives.clear();
      rule.alternatives.push_back(std::move(rewritten));
    }

  } // namespace

  grammar
  eliminate_left_recursion(grammar input) {
    auto sets = compute_lookahead_sets(input);
    for (auto& rule : input.rules())
      rewrite(rule, sets);
    return input;
  }

} // namespace ebnf
