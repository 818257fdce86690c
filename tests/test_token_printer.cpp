#include "splice/format.hpp"
#include "splice/lexer.hpp"
#include "splice/token_printer.hpp"

#include <gtest/gtest.h>
#include <format>
#include <sstream>
#include <string>

namespace {

spl::token_stream
lex(std::string_view text)
{ return spl::lexer {}.tokenize(text); }

TEST(TokenPrinterTest, PrintSpacing) {
  EXPECT_EQ(spl::to_string(lex("a::b")), "a :: b");
  EXPECT_EQ(spl::to_string(lex("x  ->\n y")), "x -> y");
  EXPECT_EQ(spl::to_string(lex("f(a, b)")), "f (a , b)");
  EXPECT_EQ(spl::to_string(lex("fn f() -> u32 { 100 }")), "fn f () -> u32 {100}");
  EXPECT_EQ(spl::to_string(lex("")), "");
}

// Printing and lexing again gives the same tree
TEST(TokenPrinterTest, RoundTrip) {
  const std::string sources[] = {
    "fn main() { let x: Vec<u8> = vec![1, 2, 3]; x.len() }",
    "impl<'a> Foo<'a> for &'a mut [u8] where T: ?Sized {}",
    "a::b::<c>::d(\"str\", r#\"raw\"#, b'x', 0x1F, 1.5e3)",
    "x += y >>= 2 && !z || w != 0",
    "#[derive(Debug)] struct S { f: i32 }",
  };

  for (const std::string &source : sources)
  {
    const spl::token_stream ts = lex(source);
    EXPECT_TRUE(spl::equal(lex(spl::to_string(ts)), ts)) << source;
  }
}

TEST(TokenPrinterTest, InvisibleGroups) {
  using spl::delimiter_kind;

  const spl::token_stream ts {
    spl::make_ident("x"),
    spl::make_group(delimiter_kind::none, {spl::make_ident("a"),
                                           spl::make_ident("b")}),
    spl::make_group(delimiter_kind::none, {}),
    spl::make_ident("y"),
  };
  EXPECT_EQ(spl::to_string(ts), "x a b y");
}

TEST(TokenPrinterTest, StreamOperator) {
  std::ostringstream oss;
  oss << spl::make_group(spl::delimiter_kind::bracket, lex("a, b"));
  EXPECT_EQ(oss.str(), "[a , b]");
}

TEST(TokenPrinterTest, Dump) {
  std::ostringstream oss;
  spl::dump(oss, lex("a::b (1) {}"));
  EXPECT_EQ(oss.str(),
            "[ident a] [punct : joint] [punct :] [ident b] "
            "[group ( [lit integer 1] )] [group { }]");

  std::ostringstream invisible;
  spl::dump(invisible, spl::make_group(spl::delimiter_kind::none,
                                       {spl::make_ident("a")}));
  EXPECT_EQ(invisible.str(), "[group ~ [ident a] ~]");
}

// Test std::format support
TEST(TokenPrinterTest, Format) {
  const spl::token_stream ts = lex("f(x)");
  EXPECT_EQ(std::format("{}", ts), "f (x)");
  EXPECT_EQ(std::format("{:d}", ts),
            "[ident f] [group ( [ident x] )]");
  EXPECT_EQ(std::format("<{}>", ts[0]), "<f>");
  EXPECT_EQ(std::format("{}", ts[1].location), "<string>:1-4");
}

} // anonymous namespace
