#include <ebnf/errors.hpp>
#include <ebnf/grammar_loader.hpp>
#include <ebnf/parser_model.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace ebnf;

static const grammar_loader loader;

static std::vector<std::string>
sorted_texts(const parser_model& m, const terminal_id_set& ids) {
  auto texts = m.texts(ids);
  std::sort(texts.begin(), texts.end());
  return texts;
}

TEST_CASE("model: rules and terminals are interned", "[parser_model]") {
  auto m = build_model(loader.load(R"(
    pair = key , "=" , key ;
    key = "k" | "=" ;
  )"));
  REQUIRE(m.rules().size() == 2);
  CHECK(m.rule(0).name == "pair");
  CHECK(m.rule(1).name == "key");
  CHECK(m.find_rule("key") == rule_id{1});
  CHECK_FALSE(m.find_rule("value").has_value());

  // Each literal text gets one id, shared by every occurrence.
  CHECK(m.terminals().size() == 2);
  auto eq = m.find_terminal("=");
  REQUIRE(eq.has_value());
  CHECK(m.terminal_text(*eq) == "=");
  CHECK_FALSE(m.find_terminal("missing").has_value());
}

TEST_CASE("model: entry rule", "[parser_model]") {
  auto g = loader.load(R"(a = b ; b = "x" ;)");
  CHECK(build_model(g).entry() == 0);
  g.set_entry("b");
  CHECK(build_model(g).entry() == 1);
  g.set_entry("c");
  CHECK_THROWS_AS(build_model(g), undefined_rule_error);
}

TEST_CASE("model: body shapes", "[parser_model]") {
  auto m = build_model(loader.load(R"(
    r = "a" , s , [ "b" ] , { "c" }- ;
    s = "x" ;
  )"));
  const auto& body = m.rule(0).body;
  REQUIRE(body.op == node_op::sequence);
  REQUIRE(body.children.size() == 4);
  CHECK(body.children[0].op == node_op::literal);
  CHECK(body.children[1].op == node_op::call);
  CHECK(body.children[1].rule == 1);
  CHECK(body.children[2].op == node_op::optional);
  CHECK(body.children[2].nullable);
  REQUIRE(body.children[3].op == node_op::repetition);
  CHECK_FALSE(body.children[3].allow_empty);
  CHECK_FALSE(body.children[3].nullable);

  // A lone term is the body itself.
  CHECK(m.rule(1).body.op == node_op::literal);
}

TEST_CASE("model: exception node", "[parser_model]") {
  auto m = build_model(loader.load(R"(
    name = ident - "if" ;
    ident = "if" | "n" ;
  )"));
  const auto& body = m.rule(0).body;
  REQUIRE(body.op == node_op::exception);
  REQUIRE(body.children.size() == 2);
  CHECK(body.children[0].op == node_op::call);
  CHECK(body.children[1].op == node_op::literal);
  CHECK(sorted_texts(m, body.first) == std::vector<std::string>{"if", "n"});
  CHECK_FALSE(body.nullable);
}

TEST_CASE("model: disjoint alternatives dispatch on one token",
          "[parser_model]") {
  auto m = build_model(loader.load(R"(
    stmt = "if" , expr | "while" , expr | expr ;
    expr = "x" | "y" ;
  )"));
  const auto& body = m.rule(0).body;
  REQUIRE(body.op == node_op::choice);
  CHECK(body.strategy == choice_strategy::predictive);
  CHECK(body.dispatch.size() == 4);
  CHECK(body.dispatch.at(*m.find_terminal("if")) == 0);
  CHECK(body.dispatch.at(*m.find_terminal("while")) == 1);
  CHECK(body.dispatch.at(*m.find_terminal("x")) == 2);
  CHECK(body.dispatch.at(*m.find_terminal("y")) == 2);
}

TEST_CASE("model: overlapping alternatives are tried in order",
          "[parser_model]") {
  auto m = build_model(loader.load(R"(d = "val" , "x" | "val" , "y" ;)"));
  const auto& body = m.rule(0).body;
  REQUIRE(body.op == node_op::choice);
  CHECK(body.strategy == choice_strategy::ordered);
  CHECK(body.dispatch.empty());
}

TEST_CASE("model: a nullable alternative forces ordered choice",
          "[parser_model]") {
  auto m = build_model(loader.load(R"(r = "a" | [ "b" ] ;)"));
  const auto& body = m.rule(0).body;
  CHECK(body.strategy == choice_strategy::ordered);
  CHECK(body.nullable);
}

TEST_CASE("model: rule lookahead annotations", "[parser_model]") {
  auto m = build_model(loader.load(R"~(
    list = item , { "," , item } ;
    item = "i" | "(" , list , ")" ;
  )~"));
  const auto& list = m.rule(0);
  CHECK(sorted_texts(m, list.first) == std::vector<std::string>{"(", "i"});
  CHECK(list.follow_end);
  CHECK(sorted_texts(m, list.follow) == std::vector<std::string>{")"});

  const auto& item = m.rule(1);
  CHECK_FALSE(item.nullable);
  CHECK(item.follow_end);
  CHECK(sorted_texts(m, item.follow) == std::vector<std::string>{")", ","});
}
