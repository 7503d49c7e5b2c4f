#include <ebnf/grammar_writer.hpp>

#include <sstream>
#include <type_traits>

namespace ebnf {

  namespace {

    void
    write_term(std::ostream& os, const term& t);

    void
    write_alternative(std::ostream& os, const alternative& alt) {
      for (std::size_t i = 0; i < alt.terms.size(); ++i) {
        if (i > 0) os << " , ";
        write_term(os, alt.terms[i]);
      }
    }

    void
    write_alternatives(std::ostream& os, const std::vector<alternative>& alts) {
      for (std::size_t i = 0; i < alts.size(); ++i) {
        if (i > 0) os << " | ";
        write_alternative(os, alts[i]);
      }
    }

    // Literals holding a double quote are written with single quotes.
    void
    write_literal(std::ostream& os, const std::string& text) {
      char quote = text.find('"') == std::string::npos ? '"' : '\'';
      os << quote << text << quote;
    }

    // Contents of [ ] and { }, where a sequence needs no parentheses.
    void
    write_body(std::ostream& os, const term& body) {
      if (body.holds<sequence_term>()) {
        const auto& terms = body.get<sequence_term>().terms;
        if (terms.size() > 1) {
          for (std::size_t i = 0; i < terms.size(); ++i) {
            if (i > 0) os << " , ";
            write_term(os, terms[i]);
          }
          return;
        }
      }
      if (body.holds<choice_term>()) {
        write_alternatives(os, body.get<choice_term>().alternatives);
        return;
      }
      write_term(os, body);
    }

    // One side of `a - b`. Nested exceptions need parentheses, and so does a
    // base `{ }` that would otherwise read as `{ }-`.
    void
    write_operand(std::ostream& os, const term& t, bool is_base) {
      bool wrap = t.holds<exception_term>() ||
                  (is_base && t.holds<repetition_term>() &&
                   t.get<repetition_term>().allow_empty);
      if (wrap) os << "( ";
      write_term(os, t);
      if (wrap) os << " )";
    }

    void
    write_term(std::ostream& os, const term& t) {
      std::visit(
          [&os](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, literal_term>) {
              write_literal(os, node.text);
            } else if constexpr (std::is_same_v<T, ref_term>) {
              os << node.name;
            } else if constexpr (std::is_same_v<T, sequence_term>) {
              os << "( ";
              for (std::size_t i = 0; i < node.terms.size(); ++i) {
                if (i > 0) os << " , ";
                write_term(os, node.terms[i]);
              }
              os << " )";
            } else if constexpr (std::is_same_v<T, choice_term>) {
              os << "( ";
              write_alternatives(os, node.alternatives);
              os << " )";
            } else if constexpr (std::is_same_v<T, repetition_term>) {
              os << "{ ";
              if (node.body) write_body(os, *node.body);
              os << (node.allow_empty ? " }" : " }-");
            } else if constexpr (std::is_same_v<T, optional_term>) {
              os << "[ ";
              if (node.body) write_body(os, *node.body);
              os << " ]";
            } else if constexpr (std::is_same_v<T, exception_term>) {
              if (node.base) write_operand(os, *node.base, true);
              os << " - ";
              if (node.except) write_operand(os, *node.except, false);
            }
          },
          t.data());
    }

  } // namespace

  std::string
  grammar_writer::write(const grammar& g) const {
    std::string out;
    for (const auto& r : g.rules())
      out += write(r) + "\n";
    return out;
  }

  std::string
  grammar_writer::write(const grammar_rule& rule) const {
    std::ostringstream os;
    os << rule.name << " = ";
    write_alternatives(os, rule.alternatives);
    os << " ;";
    return os.str();
  }

  std::string
  grammar_writer::write(const term& t) const {
    std::ostringstream os;
    write_term(os, t);
    return os.str();
  }

} // namespace ebnf
