#include <ebnf/errors.hpp>
#include <ebnf/grammar_loader.hpp>
#include <ebnf/grammar_validator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace ebnf;

static const grammar_loader loader;
static const grammar_validator validator;

static validation_result
validate(const std::string& source) {
  return validator.validate(loader.load(source));
}

// == Fatal checks =============================================================

TEST_CASE("validator: well-formed grammar has no warnings",
          "[grammar_validator]") {
  auto result = validate(R"~(
    list = item , { "," , item } ;
    item = "i" | "(" , list , ")" ;
  )~");
  CHECK(result.warnings.empty());
}

TEST_CASE("validator: duplicate rule", "[grammar_validator]") {
  try {
    (void)validate(R"(a = b ; b = "x" ; b = "y" ;)");
    FAIL("expected duplicate_rule_error");
  } catch (const duplicate_rule_error& e) {
    CHECK(e.name() == "b");
  }
}

TEST_CASE("validator: undefined reference", "[grammar_validator]") {
  try {
    (void)validate(R"(a = "x" , b ; b = [ c ] ;)");
    FAIL("expected undefined_rule_error");
  } catch (const undefined_rule_error& e) {
    CHECK(e.name() == "c");
    CHECK(e.referenced_from() == "b");
  }
}

TEST_CASE("validator: missing entry rule", "[grammar_validator]") {
  auto g = loader.load(R"(a = "x" ;)");
  g.set_entry("start");
  try {
    (void)validator.validate(g);
    FAIL("expected undefined_rule_error");
  } catch (const undefined_rule_error& e) {
    CHECK(e.name() == "start");
    CHECK(e.referenced_from().empty());
  }
}

TEST_CASE("validator: direct left recursion", "[grammar_validator]") {
  try {
    (void)validate(R"(typ = var | typ , "->" , typ ; var = "a" ;)");
    FAIL("expected left_recursion_error");
  } catch (const left_recursion_error& e) {
    CHECK(e.cycle() == std::vector<std::string>{"typ"});
    CHECK(std::string(e.what()) == "left recursion: typ -> typ");
  }
}

TEST_CASE("validator: indirect left recursion reports the exact cycle",
          "[grammar_validator]") {
  try {
    (void)validate(R"(
      a = b , "x" | "y" ;
      b = c , "y" ;
      c = a , "z" ;
    )");
    FAIL("expected left_recursion_error");
  } catch (const left_recursion_error& e) {
    CHECK(e.cycle() == std::vector<std::string>{"a", "b", "c"});
  }
}

TEST_CASE("validator: left recursion behind a nullable prefix",
          "[grammar_validator]") {
  try {
    (void)validate(R"(
      s = [ "x" ] , opt , s , "y" | "z" ;
      opt = { "w" } ;
    )");
    FAIL("expected left_recursion_error");
  } catch (const left_recursion_error& e) {
    CHECK(e.cycle() == std::vector<std::string>{"s"});
  }
}

TEST_CASE("validator: recursion after a terminal is fine",
          "[grammar_validator]") {
  CHECK_NOTHROW(validate(R"~(s = "(" , s , ")" | "x" ;)~"));
}

TEST_CASE("validator: both sides of an exception are checked",
          "[grammar_validator]") {
  SECTION("undefined rule in the excluded form") {
    try {
      (void)validate(R"(a = "x" - missing ;)");
      FAIL("expected undefined_rule_error");
    } catch (const undefined_rule_error& e) {
      CHECK(e.name() == "missing");
      CHECK(e.referenced_from() == "a");
    }
  }
  SECTION("the excluded form is tried at the same position") {
    try {
      (void)validate(R"(a = "x" - b ; b = a , "y" ;)");
      FAIL("expected left_recursion_error");
    } catch (const left_recursion_error& e) {
      CHECK(e.cycle() == std::vector<std::string>{"a", "b"});
    }
  }
  SECTION("rules used only for exclusion are reachable") {
    auto result = validate(R"(a = "x" - b ; b = "x" ;)");
    CHECK(result.warnings.empty());
  }
}

TEST_CASE("validator: repetition of something nullable",
          "[grammar_validator]") {
  SECTION("optional body") {
    try {
      (void)validate(R"(a = { [ "x" ] } ;)");
      FAIL("expected infinite_loop_error");
    } catch (const infinite_loop_error& e) {
      CHECK(e.rule() == "a");
    }
  }
  SECTION("nested repetition body") {
    CHECK_THROWS_AS(validate(R"(a = "s" , { { "x" } } ;)"),
                    infinite_loop_error);
  }
  SECTION("nullable rule body") {
    CHECK_THROWS_AS(validate(R"(a = { b } ; b = [ "x" ] ;)"),
                    infinite_loop_error);
  }
  SECTION("non-empty repetition is no better") {
    CHECK_THROWS_AS(validate(R"(a = { [ "x" ] }- ;)"), infinite_loop_error);
  }
}

TEST_CASE("validator: checks run in a fixed order", "[grammar_validator]") {
  // Duplicate names are reported before the undefined reference.
  CHECK_THROWS_AS(validate(R"(a = missing ; a = "x" ;)"),
                  duplicate_rule_error);
  // Undefined references are reported before left recursion.
  CHECK_THROWS_AS(validate(R"(a = a , missing | "x" ;)"),
                  undefined_rule_error);
}

// == Warnings =================================================================

TEST_CASE("validator: unreachable rule warning", "[grammar_validator]") {
  auto result = validate(R"(a = "x" ; orphan = "y" ;)");
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].kind == warning_kind::unreachable_rule);
  CHECK(result.warnings[0].rule == "orphan");
}

TEST_CASE("validator: reachability follows the entry rule",
          "[grammar_validator]") {
  auto g = loader.load(R"(a = "x" ; b = c ; c = "y" ;)");
  g.set_entry("b");
  auto result = validator.validate(g);
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].rule == "a");
}

TEST_CASE("validator: overlapping alternatives", "[grammar_validator]") {
  auto result = validate(R"(
    dec = "val" , "x" | "val" , "y" , "z" | "type" ;
  )");
  REQUIRE(result.warnings.size() == 1);
  const auto& w = result.warnings[0];
  CHECK(w.kind == warning_kind::ambiguity);
  CHECK(w.rule == "dec");
  CHECK(w.alternatives == std::vector<std::size_t>{0, 1});
  CHECK(w.overlap == std::vector<std::string>{"val"});
}

TEST_CASE("validator: overlap inside a nested choice", "[grammar_validator]") {
  auto result = validate(R"(r = "a" , ( "b" | "c" | "b" , "d" ) ;)");
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].alternatives == std::vector<std::size_t>{0, 2});
  CHECK(result.warnings[0].overlap == std::vector<std::string>{"b"});
}

TEST_CASE("validator: overlap through referenced rules",
          "[grammar_validator]") {
  auto result = validate(R"(
    constant = real | int ;
    real = int , "." , digit ;
    int = [ "-" ] , digit ;
    digit = "0" | "1" ;
  )");
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].overlap ==
        std::vector<std::string>{"-", "0", "1"});
}

TEST_CASE("validator: warning text", "[grammar_validator]") {
  grammar_warning unreachable{warning_kind::unreachable_rule, "x", {}, {}};
  CHECK(unreachable.message() == "rule 'x' is unreachable from the entry rule");

  grammar_warning ambiguity{warning_kind::ambiguity, "r", {0, 2}, {"a", "b"}};
  std::ostringstream os;
  os << ambiguity;
  CHECK(os.str() == "alternatives 0 and 2 in rule 'r' share first terminals "
                    "\"a\", \"b\"; the earlier alternative wins");
}
