#include <ebnf/grammar_writer.hpp>
#include <ebnf/rule_header.hpp>

#include <set>
#include <stdexcept>
#include <unordered_set>

namespace ebnf {

  namespace {

    const std::unordered_set<std::string>&
    keywords() {
      static const std::unordered_set<std::string> words = {
          "alignas",   "alignof",      "and",          "and_eq",
          "asm",       "auto",         "bitand",       "bitor",
          "bool",      "break",        "case",         "catch",
          "char",      "char8_t",      "char16_t",     "char32_t",
          "class",     "compl",        "concept",      "const",
          "consteval", "constexpr",    "constinit",    "const_cast",
          "continue",  "co_await",     "co_return",    "co_yield",
          "decltype",  "default",      "delete",       "do",
          "double",    "dynamic_cast", "else",         "enum",
          "explicit",  "export",       "extern",       "false",
          "float",     "for",          "friend",       "goto",
          "if",        "inline",       "int",          "long",
          "mutable",   "namespace",    "new",          "noexcept",
          "not",       "not_eq",       "nullptr",      "operator",
          "or",        "or_eq",        "private",      "protected",
          "public",    "register",     "reinterpret_cast",
          "requires",  "return",       "short",        "signed",
          "sizeof",    "static",       "static_assert", "static_cast",
          "struct",    "switch",       "template",     "this",
          "thread_local", "throw",     "true",         "try",
          "typedef",   "typeid",       "typename",     "union",
          "unsigned",  "using",        "virtual",      "void",
          "volatile",  "wchar_t",      "while",        "xor",
          "xor_eq",
      };
      return words;
    }

    bool
    reserved(const std::string& name) {
      if (name.find("__") != std::string::npos) return true;
      return name.size() > 1 && name[0] == '_' && name[1] >= 'A' &&
             name[1] <= 'Z';
    }

    std::string
    quoted(const std::string& text) {
      return "\"" + text + "\"";
    }

  } // namespace

  std::string
  rule_identifier(const std::string& rule_name) {
    if (keywords().count(rule_name) || reserved(rule_name))
      return rule_name + '_';
    return rule_name;
  }

  cpp_file
  generate_rule_header(const grammar& g, const rule_header_options& opts) {
    if (g.rules().empty())
      throw std::invalid_argument("generate_rule_header: empty grammar");

    cpp_enum rules{"rule", {}};
    std::set<std::string> used;
    for (const auto& r : g.rules()) {
      auto base = rule_identifier(r.name);
      auto id = base;
      // A rule named `int_` next to one named `int`.
      for (int n = 2; !used.insert(id).second; ++n)
        id = base + std::to_string(n);
      rules.values.push_back({id, r.name});
    }

    grammar_writer writer;
    cpp_text_constant text{"grammar_text", "\n" + writer.write(g)};

    std::string entry = opts.entry_rule.empty() ? g.entry() : opts.entry_rule;
    if (!g.find_rule(entry))
      throw std::invalid_argument("generate_rule_header: no rule '" + entry +
                                  "'");

    cpp_function make_parser;
    make_parser.return_type = "ebnf::grammar_parser";
    make_parser.name = "make_parser";
    make_parser.body = "  ebnf::compile_options options;\n"
                       "  options.entry_rule = " +
                       quoted(entry) +
                       ";\n"
                       "  return ebnf::compile(std::string(grammar_text), "
                       "options).parser;\n";

    cpp_function procedure;
    procedure.return_type = "ebnf::rule_procedure";
    procedure.name = "procedure";
    procedure.parameters = "const ebnf::grammar_parser& parser, rule r";
    procedure.body = "  return parser.rule(std::string(to_string(r)));\n";

    cpp_file file;
    file.filename = opts.filename;
    file.includes = {{"<ebnf/compiler.hpp>"},
                     {"<stdexcept>"},
                     {"<string>"},
                     {"<string_view>"}};
    file.namespaces.push_back(
        {opts.namespace_name,
         {std::move(rules), std::move(text), std::move(make_parser),
          std::move(procedure)}});
    return file;
  }

} // namespace ebnf
