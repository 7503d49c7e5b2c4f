#include <ebnf/cpp_writer.hpp>

#include <algorithm>
#include <sstream>

namespace ebnf {

  namespace {

    bool
    is_system(const cpp_include& inc) {
      return !inc.path.empty() && inc.path.front() == '<';
    }

    // Delimiter that does not occur as `)delim"` inside the value.
    std::string
    raw_delimiter(const std::string& value) {
      std::string delim = "ebnf";
      for (int n = 0; value.find(')' + delim + '"') != std::string::npos; ++n)
        delim = "ebnf" + std::to_string(n);
      return delim;
    }

    class header_printer {
      std::ostream& os_;

    public:
      explicit header_printer(std::ostream& os) : os_(os) {}

      void
      includes(std::vector<cpp_include> incs) {
        if (incs.empty()) return;
        auto system = std::stable_partition(
            incs.begin(), incs.end(),
            [](const cpp_include& inc) { return !is_system(inc); });

        os_ << '\n';
        for (auto it = incs.begin(); it != incs.end(); ++it) {
          if (it == system && it != incs.begin()) os_ << '\n';
          os_ << "#include " << it->path << '\n';
        }
      }

      void
      namespace_block(const cpp_namespace& ns) {
        os_ << "\nnamespace " << ns.name << " {\n";
        for (const auto& decl : ns.declarations) {
          os_ << '\n';
          std::visit([this](const auto& d) { declaration(d); }, decl);
        }
        os_ << "\n} // namespace " << ns.name << '\n';
      }

    private:
      void
      quoted(const std::string& text) {
        os_ << '"';
        for (char c : text) {
          if (c == '"' || c == '\\') os_ << '\\';
          os_ << c;
        }
        os_ << '"';
      }

      // The enum, then to_string and <name>_from_string over the same texts.
      void
      declaration(const cpp_enum& e) {
        os_ << "enum class " << e.name << " {\n";
        for (const auto& v : e.values)
          os_ << "  " << v.name << ",\n";
        os_ << "};\n";

        os_ << "\ninline std::string_view to_string(" << e.name << " v) {\n"
            << "  switch (v) {\n";
        for (const auto& v : e.values) {
          os_ << "  case " << e.name << "::" << v.name << ": return ";
          quoted(v.text);
          os_ << ";\n";
        }
        os_ << "  }\n"
            << "  return \"\";\n"
            << "}\n";

        os_ << "\ninline " << e.name << ' ' << e.name
            << "_from_string(std::string_view s) {\n";
        for (const auto& v : e.values) {
          os_ << "  if (s == ";
          quoted(v.text);
          os_ << ") return " << e.name << "::" << v.name << ";\n";
        }
        os_ << "  throw std::invalid_argument(std::string(\"invalid " << e.name
            << " value: \") + std::string(s));\n"
            << "}\n";
      }

      void
      declaration(const cpp_text_constant& c) {
        auto delim = raw_delimiter(c.value);
        os_ << "inline constexpr std::string_view " << c.name << " = R\""
            << delim << '(' << c.value << ')' << delim << "\";\n";
      }

      void
      declaration(const cpp_function& f) {
        os_ << "inline " << f.return_type << ' ' << f.name << '('
            << f.parameters << ") {\n"
            << f.body << "}\n";
      }
    };

  } // namespace

  std::string
  cpp_writer::write(const cpp_file& file) const {
    std::ostringstream os;
    os << "#pragma once\n";
    header_printer print(os);
    print.includes(file.includes);
    for (const auto& ns : file.namespaces)
      print.namespace_block(ns);
    return os.str();
  }

} // namespace ebnf
