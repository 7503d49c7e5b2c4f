#include <ebnf/grammar_loader.hpp>
#include <ebnf/grammar_writer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace ebnf;

static const grammar_loader loader;
static const grammar_writer writer;

TEST_CASE("writer: rule layout", "[grammar_writer]") {
  auto g = loader.load(R"(pair = key , "=" , value | key ;)");
  CHECK(writer.write(g.rules()[0]) == R"(pair = key , "=" , value | key ;)");
}

TEST_CASE("writer: one rule per line", "[grammar_writer]") {
  auto g = loader.load(R"(a = b ; b = "x" ;)");
  CHECK(writer.write(g) == "a = b ;\nb = \"x\" ;\n");
}

TEST_CASE("writer: groups keep their parentheses", "[grammar_writer]") {
  auto g = loader.load(R"(r = ( "a" , "b" ) , ( "c" | "d" ) ;)");
  CHECK(writer.write(g.rules()[0]) ==
        R"(r = ( "a" , "b" ) , ( "c" | "d" ) ;)");
}

TEST_CASE("writer: optional and repetition bodies", "[grammar_writer]") {
  auto g = loader.load(R"(r = [ "a" , "b" ] , { "c" | "d" } , { e }- ;)");
  CHECK(writer.write(g.rules()[0]) ==
        R"(r = [ "a" , "b" ] , { "c" | "d" } , { e }- ;)");
}

TEST_CASE("writer: exceptions", "[grammar_writer]") {
  auto g = loader.load(R"(r = letter - "x" , { "a" }- - "b" ; letter = "x" ;)");
  CHECK(writer.write(g.rules()[0]) ==
        R"(r = letter - "x" , { "a" }- - "b" ;)");

  term any_a(repetition_term{make_term(lit("a")), true});
  term empty_base(
      exception_term{make_term(std::move(any_a)), make_term(lit("b"))});
  CHECK(writer.write(empty_base) == R"(( { "a" } ) - "b")");

  term inner(exception_term{make_term(ref("b")), make_term(lit("c"))});
  term nested(exception_term{make_term(ref("a")), make_term(std::move(inner))});
  CHECK(writer.write(nested) == R"~(a - ( b - "c" ))~");
}

TEST_CASE("writer: literal with a double quote", "[grammar_writer]") {
  CHECK(writer.write(lit("\"")) == R"('"')");
  CHECK(writer.write(lit("'")) == R"("'")");
}

TEST_CASE("writer: output loads back to an equal grammar",
          "[grammar_writer]") {
  const char* sources[] = {
      R"(a = "x" ;)",
      R"~(list = item , { "," , item } ; item = "i" | "(" , list , ")" ;)~",
      R"(r = [ ( "a" | "b" ) , "c" ] , { [ "d" ] , "e" }- ;)",
      R"(s = '"' , { "x" } , '"' ; t = ( ( "y" ) ) ;)",
      R"(u = ( { "a" } ) - "b" , ( "c" , "d" ) - "c" ; v = u - ( u - "a" ) ;)",
  };
  for (const auto* source : sources) {
    auto first = loader.load(source);
    auto text = writer.write(first);
    auto second = loader.load(text);
    INFO(text);
    CHECK(first == second);
    CHECK(writer.write(second) == text);
  }
}

TEST_CASE("writer: equality ignores the entry designation",
          "[grammar_writer]") {
  auto g = loader.load(R"(a = b ; b = "x" ;)");
  g.set_entry("b");
  auto reloaded = loader.load(writer.write(g));
  CHECK(reloaded.entry() == "a");
  CHECK(reloaded == g);
}
