#include <ebnf/compiler.hpp>
#include <ebnf/errors.hpp>
#include <ebnf/grammar_loader.hpp>
#include <ebnf/scanner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace ebnf;

// == Pipeline =================================================================

TEST_CASE("compile: warnings are returned and written to diagnostics",
          "[compile]") {
  std::ostringstream diag;
  compile_options options;
  options.diagnostics = &diag;
  auto result = compile(R"(
    dec = "val" , "x" | "val" , "y" ;
    orphan = "z" ;
  )",
                        options);

  REQUIRE(result.warnings.size() == 2);
  CHECK(result.warnings[0].kind == warning_kind::unreachable_rule);
  CHECK(result.warnings[1].kind == warning_kind::ambiguity);
  CHECK(diag.str() ==
        "ebnf: warning: rule 'orphan' is unreachable from the entry rule\n"
        "ebnf: warning: alternatives 0 and 1 in rule 'dec' share first "
        "terminals \"val\"; the earlier alternative wins\n");
}

TEST_CASE("compile: no diagnostics stream by default", "[compile]") {
  auto result = compile(R"(a = "x" ; b = "y" ;)");
  CHECK(result.warnings.size() == 1);
  CHECK(result.parser.entry_rule() == "a");
}

TEST_CASE("compile: entry rule option", "[compile]") {
  compile_options options;
  options.entry_rule = "b";
  auto result = compile(R"(a = b , b ; b = "x" ;)", options);
  CHECK(result.parser.entry_rule() == "b");
  // a is now unreachable.
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].rule == "a");

  options.entry_rule = "c";
  CHECK_THROWS_AS(compile(R"(a = "x" ;)", options), undefined_rule_error);
}

TEST_CASE("compile: fatal errors propagate", "[compile]") {
  CHECK_THROWS_AS(compile("a = ;"), grammar_syntax_error);
  CHECK_THROWS_AS(compile(R"(a = "x" ; a = "y" ;)"), duplicate_rule_error);
  CHECK_THROWS_AS(compile(R"(a = b ;)"), undefined_rule_error);
  CHECK_THROWS_AS(compile(R"(a = b , "x" | "y" ; b = a ;)"),
                  left_recursion_error);
  CHECK_THROWS_AS(compile(R"(a = { [ "x" ] } ;)"), infinite_loop_error);
}

TEST_CASE("compile: left recursion rewrite can be turned off", "[compile]") {
  const char* source = R"(e = e , "+" , "x" | "x" ;)";
  CHECK_NOTHROW(compile(source));

  compile_options options;
  options.resolve_left_recursion = false;
  try {
    (void)compile(source, options);
    FAIL("expected left_recursion_error");
  } catch (const left_recursion_error& e) {
    CHECK(e.cycle() == std::vector<std::string>{"e"});
  }
}

TEST_CASE("compile: left recursion with an empty-matching tail is reported",
          "[compile]") {
  for (const char* source :
       {R"(r = "a" | r , [ "b" ] ;)", R"(r = "a" | r , { "b" } ;)"}) {
    INFO(source);
    try {
      (void)compile(source);
      FAIL("expected left_recursion_error");
    } catch (const left_recursion_error& e) {
      CHECK(e.cycle() == std::vector<std::string>{"r"});
    }
  }
}

TEST_CASE("compile: parser options are carried", "[compile]") {
  compile_options options;
  options.parser.max_depth = 3;
  auto result = compile(R"~(n = "(" , n , ")" | "x" ;)~", options);
  CHECK(result.parser.options().max_depth == 3);

  auto lexer = scanner::for_parser(result.parser);
  CHECK_NOTHROW(result.parser.parse(lexer.scan("( ( x ) )")));
  CHECK_THROWS_AS(result.parser.parse(lexer.scan("( ( ( x ) ) )")),
                  recursion_depth_exceeded_error);
}

TEST_CASE("compile: from a loaded grammar", "[compile]") {
  grammar_loader loader;
  auto result = compile(loader.load(R"(s = "a" ;)"));
  CHECK(result.parser.rule_names() == std::vector<std::string>{"s"});
}

// == Derived sentences ========================================================

namespace {

  // Random derivations from the grammar IR. Past `depth` the first
  // alternative is always taken, and repetitions and optionals stay empty.
  class deriver {
    const grammar& g_;
    std::mt19937 rng_;
    std::vector<std::string> out_;

  public:
    deriver(const grammar& g, unsigned seed) : g_(g), rng_(seed) {}

    std::vector<std::string>
    sentence(const std::string& rule) {
      out_.clear();
      derive_rule(rule, 0);
      return out_;
    }

  private:
    std::size_t
    pick(std::size_t n) {
      return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng_);
    }

    void
    derive_rule(const std::string& name, int depth) {
      const auto& alts = g_.find_rule(name)->alternatives;
      derive_alternative(alts[depth > 4 ? 0 : pick(alts.size())], depth + 1);
    }

    void
    derive_alternative(const alternative& alt, int depth) {
      for (const auto& t : alt.terms)
        derive_term(t, depth);
    }

    void
    derive_term(const term& t, int depth) {
      if (t.holds<literal_term>()) {
        out_.push_back(t.get<literal_term>().text);
      } else if (t.holds<ref_term>()) {
        derive_rule(t.get<ref_term>().name, depth);
      } else if (t.holds<sequence_term>()) {
        for (const auto& child : t.get<sequence_term>().terms)
          derive_term(child, depth);
      } else if (t.holds<choice_term>()) {
        const auto& alts = t.get<choice_term>().alternatives;
        derive_alternative(alts[depth > 4 ? 0 : pick(alts.size())], depth);
      } else if (t.holds<repetition_term>()) {
        const auto& rep = t.get<repetition_term>();
        std::size_t n = depth > 4 ? 0 : pick(3);
        if (!rep.allow_empty && n == 0) n = 1;
        for (std::size_t i = 0; i < n; ++i)
          derive_term(*rep.body, depth + 1);
      } else if (t.holds<optional_term>()) {
        if (depth <= 4 && pick(2) == 1)
          derive_term(*t.get<optional_term>().body, depth + 1);
      }
    }
  };

  std::string
  join(const std::vector<std::string>& words) {
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i) {
      if (i > 0) out += ' ';
      out += words[i];
    }
    return out;
  }

} // namespace

TEST_CASE("compile: derived sentences parse back to their text",
          "[compile]") {
  const char* source = R"~(
    list = item , { "," , item } ;
    item = "i"
         | "(" , list , ")"
         | "[" , [ list ] , "]"
         | "<" , { "k" }- , ">" ;
  )~";
  grammar_loader loader;
  auto g = loader.load(source);
  auto result = compile(source);
  REQUIRE(result.warnings.empty());
  auto lexer = scanner::for_parser(result.parser);

  for (unsigned seed = 0; seed < 50; ++seed) {
    deriver d(g, seed);
    auto text = join(d.sentence("list"));
    INFO(text);
    auto tree = result.parser.parse(lexer.scan(text));
    CHECK(tree.tag() == "list");
    CHECK(tree.source() == text);
  }
}
