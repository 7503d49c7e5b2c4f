#include <ebnf/compiler.hpp>
#include <ebnf/grammar_loader.hpp>
#include <ebnf/grammar_validator.hpp>
#include <ebnf/left_recursion.hpp>
#include <ebnf/parser_model.hpp>

namespace ebnf {

  compile_result
  compile(const std::string& text, const compile_options& options) {
    grammar_loader loader;
    return compile(loader.load(text), options);
  }

  compile_result
  compile(grammar g, const compile_options& options) {
    if (!options.entry_rule.empty()) g.set_entry(options.entry_rule);
    if (options.resolve_left_recursion) g = eliminate_left_recursion(std::move(g));

    grammar_validator validator;
    auto validation = validator.validate(g);
    if (options.diagnostics) {
      for (const auto& w : validation.warnings)
        *options.diagnostics << "ebnf: warning: " << w << '\n';
    }

    return compile_result{emit(build_model(g), options.parser),
                          std::move(validation.warnings)};
  }

} // namespace ebnf
