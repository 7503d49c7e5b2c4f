#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ebnf {

  class term;

  // ---------------------------------------------------------------------------
  // Term node types
  // ---------------------------------------------------------------------------

  struct literal_term {
    std::string text;
  };

  struct ref_term {
    std::string name;
  };

  struct sequence_term {
    std::vector<term> terms;
  };

  struct alternative {
    std::vector<term> terms;

    bool
    operator==(const alternative& other) const;
  };

  struct choice_term {
    std::vector<alternative> alternatives;
  };

  struct repetition_term {
    std::unique_ptr<term> body;
    bool allow_empty = true;
  };

  struct optional_term {
    std::unique_ptr<term> body;
  };

  // `base - except`: base, provided except does not match at the same place.
  struct exception_term {
    std::unique_ptr<term> base;
    std::unique_ptr<term> except;
  };

  // ---------------------------------------------------------------------------
  // Term
  // ---------------------------------------------------------------------------

  class term {
  public:
    using variant_type =
        std::variant<literal_term, ref_term, sequence_term, choice_term,
                     repetition_term, optional_term, exception_term>;

    term(variant_type v) : data_(std::move(v)) {}

    term(literal_term v) : data_(std::move(v)) {}

    term(ref_term v) : data_(std::move(v)) {}

    term(sequence_term v) : data_(std::move(v)) {}

    term(choice_term v) : data_(std::move(v)) {}

    term(repetition_term v) : data_(std::move(v)) {}

    term(optional_term v) : data_(std::move(v)) {}

    term(exception_term v) : data_(std::move(v)) {}

    term(const term&) = delete;
    term&
    operator=(const term&) = delete;
    term(term&&) = default;
    term&
    operator=(term&&) = default;

    const variant_type&
    data() const {
      return data_;
    }

    variant_type&
    data() {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    template <typename T>
    T&
    get() {
      return std::get<T>(data_);
    }

    bool
    operator==(const term& other) const;

  private:
    variant_type data_;
  };

  // ---------------------------------------------------------------------------
  // Factory helpers
  // ---------------------------------------------------------------------------

  template <typename T>
  std::unique_ptr<term>
  make_term(T&& node) {
    return std::make_unique<term>(std::forward<T>(node));
  }

  inline term
  lit(std::string text) {
    return term(literal_term{std::move(text)});
  }

  inline term
  ref(std::string name) {
    return term(ref_term{std::move(name)});
  }

  // ---------------------------------------------------------------------------
  // Rules and grammar
  // ---------------------------------------------------------------------------

  struct grammar_rule {
    std::string name;
    std::vector<alternative> alternatives;
    std::size_t line = 0;

    bool
    operator==(const grammar_rule& other) const;
  };

  class grammar {
    std::vector<grammar_rule> rules_;
    std::string entry_;

  public:
    grammar() = default;

    grammar(const grammar&) = delete;
    grammar&
    operator=(const grammar&) = delete;
    grammar(grammar&&) = default;
    grammar&
    operator=(grammar&&) = default;

    void
    add_rule(grammar_rule rule) {
      rules_.push_back(std::move(rule));
    }

    const std::vector<grammar_rule>&
    rules() const {
      return rules_;
    }

    std::vector<grammar_rule>&
    rules() {
      return rules_;
    }

    // First rule with the given name, or nullptr.
    const grammar_rule*
    find_rule(const std::string& name) const;

    // The designated entry rule name; the first rule when none was set.
    std::string
    entry() const;

    void
    set_entry(std::string name) {
      entry_ = std::move(name);
    }

    // Compares rules only. The entry designation has no EBNF spelling, so
    // it does not survive a write and load.
    bool
    operator==(const grammar& other) const;
  };

} // namespace ebnf
