#pragma once

#include <string>
#include <variant>
#include <vector>

namespace ebnf {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_enumerator {
    std::string name;
    // Spelling used by to_string and <enum>_from_string.
    std::string text;

    bool
    operator==(const cpp_enumerator&) const = default;
  };

  struct cpp_enum {
    std::string name;
    std::vector<cpp_enumerator> values;

    bool
    operator==(const cpp_enum&) const = default;
  };

  // `inline constexpr std::string_view name = R"delim(value)delim";`
  struct cpp_text_constant {
    std::string name;
    std::string value;

    bool
    operator==(const cpp_text_constant&) const = default;
  };

  // Always emitted as an inline definition.
  struct cpp_function {
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string body;

    bool
    operator==(const cpp_function&) const = default;
  };

  using cpp_decl = std::variant<cpp_enum, cpp_text_constant, cpp_function>;

  struct cpp_namespace {
    std::string name;
    std::vector<cpp_decl> declarations;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  // A self-contained header.
  struct cpp_file {
    std::string filename;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;

    bool
    operator==(const cpp_file&) const = default;
  };

} // namespace ebnf
