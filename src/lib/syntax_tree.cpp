#include <ebnf/syntax_tree.hpp>

#include <stdexcept>

namespace ebnf {

  namespace {

    void
    collect_texts(const syntax_node& node, std::vector<std::string>& out) {
      if (node.is_token()) {
        out.push_back(node.leaf().text);
        return;
      }
      for (const auto& c : node.children())
        collect_texts(c, out);
    }

    bool
    is_transparent(const syntax_node& node) {
      return node.kind() == node_kind::repetition ||
             node.kind() == node_kind::group ||
             node.kind() == node_kind::optional;
    }

    void
    collect_rules(const syntax_node& node,
                  std::vector<const syntax_node*>& out) {
      for (const auto& c : node.children()) {
        if (c.is_rule())
          out.push_back(&c);
        else if (is_transparent(c))
          collect_rules(c, out);
      }
    }

  } // namespace

  syntax_node
  syntax_node::make_rule(std::string name, std::vector<syntax_node> children) {
    return syntax_node(node_kind::rule, std::move(name), std::move(children));
  }

  syntax_node
  syntax_node::make_leaf(token tok) {
    syntax_node node(node_kind::token, tok.text, {});
    node.token_ = std::move(tok);
    return node;
  }

  syntax_node
  syntax_node::make_repetition(std::vector<syntax_node> groups) {
    return syntax_node(node_kind::repetition, {}, std::move(groups));
  }

  syntax_node
  syntax_node::make_group(std::vector<syntax_node> children) {
    return syntax_node(node_kind::group, {}, std::move(children));
  }

  syntax_node
  syntax_node::make_optional(std::vector<syntax_node> children) {
    return syntax_node(node_kind::optional, {}, std::move(children));
  }

  syntax_node
  syntax_node::make_absent() {
    syntax_node node(node_kind::optional, {}, {});
    node.present_ = false;
    return node;
  }

  const token&
  syntax_node::leaf() const {
    if (!token_) throw std::logic_error("syntax_node: not a token node");
    return *token_;
  }

  std::string
  syntax_node::text() const {
    std::vector<std::string> texts;
    collect_texts(*this, texts);
    std::string out;
    for (const auto& t : texts)
      out += t;
    return out;
  }

  std::string
  syntax_node::source() const {
    std::vector<std::string> texts;
    collect_texts(*this, texts);
    std::string out;
    for (std::size_t i = 0; i < texts.size(); ++i) {
      if (i > 0) out += ' ';
      out += texts[i];
    }
    return out;
  }

  const syntax_node*
  syntax_node::child(std::string_view name) const {
    for (const auto* c : rule_children()) {
      if (c->tag() == name) return c;
    }
    return nullptr;
  }

  const syntax_node*
  syntax_node::find(std::string_view name) const {
    for (const auto& c : children_) {
      if (c.is_rule() && c.tag() == name) return &c;
      if (const auto* hit = c.find(name)) return hit;
    }
    return nullptr;
  }

  std::vector<const syntax_node*>
  syntax_node::rule_children() const {
    std::vector<const syntax_node*> out;
    collect_rules(*this, out);
    return out;
  }

  std::ostream&
  operator<<(std::ostream& os, const syntax_node& node) {
    auto children = [&os, &node]() {
      for (std::size_t i = 0; i < node.children().size(); ++i) {
        if (i > 0) os << ' ';
        os << node.children()[i];
      }
    };
    switch (node.kind()) {
      case node_kind::rule:
        os << '(' << node.tag();
        if (!node.children().empty()) os << ' ';
        children();
        os << ')';
        break;
      case node_kind::token:
        os << '"' << node.leaf().text << '"';
        break;
      case node_kind::repetition:
        os << '{';
        children();
        os << '}';
        break;
      case node_kind::group:
        os << '<';
        children();
        os << '>';
        break;
      case node_kind::optional:
        os << '[';
        children();
        os << ']';
        break;
    }
    return os;
  }

} // namespace ebnf
