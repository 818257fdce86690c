#include "splice/lexer.hpp"
#include "splice/splice_scanner.hpp"
#include "splice/token_printer.hpp"

#include <gtest/gtest.h>

namespace {

spl::token_stream
lex(std::string_view text)
{ return spl::lexer {}.tokenize(text); }

std::string
scan_text(std::string_view text)
{
  const spl::token_stream ts = lex(text);
  return spl::to_string(spl::scan(ts, ts));
}


TEST(SpliceScannerTest, RecognizeUnits) {
  EXPECT_TRUE(spl::is_splice_open(lex("[<a>]")[0]));
  EXPECT_TRUE(spl::is_splice_open(lex("[<]")[0]));
  EXPECT_FALSE(spl::is_splice_open(lex("[a<b>]")[0]));
  EXPECT_FALSE(spl::is_splice_open(lex("(<a>)")[0]));
  EXPECT_FALSE(spl::is_splice_open(lex("[]")[0]));
  EXPECT_FALSE(spl::is_splice_open(lex("<")[0]));
}

TEST(SpliceScannerTest, DelimitUnit) {
  const spl::token_stream ts = lex("x [<a b:lower>]");
  const spl::splice_unit unit = spl::delimit_splice_unit(ts, 1);
  EXPECT_EQ(unit.index, 1);
  EXPECT_EQ(unit.group, &ts[1]);

  const auto body = unit.body();
  ASSERT_EQ(body.size(), 4);
  EXPECT_TRUE(body[0].is_ident("a"));
  EXPECT_TRUE(body[3].is_ident("lower"));
}

TEST(SpliceScannerTest, UnterminatedUnit) {
  for (const char *text : {"[<foo bar]", "[<]", "[<foo>bar]"})
  {
    const spl::token_stream ts = lex(text);
    try
    {
      [[maybe_unused]] const auto unit = spl::delimit_splice_unit(ts, 0);
      FAIL() << "splice_error expected for " << text;
    }
    catch (const spl::splice_error &exn)
    {
      EXPECT_EQ(exn.code(), spl::splice_errc::malformed_splice_syntax) << text;
      EXPECT_EQ(exn.location(), ts[0].location) << text;
    }
  }
}

TEST(SpliceScannerTest, ContainsUnits) {
  EXPECT_TRUE(spl::contains_splice_units(lex("[<a>]")));
  EXPECT_TRUE(spl::contains_splice_units(lex("fn f() { g([<a b>]) }")));
  EXPECT_FALSE(spl::contains_splice_units(lex("fn f() { g([a, b]) }")));
  EXPECT_FALSE(spl::contains_splice_units({}));
}

// Test rewriting of token trees
TEST(SpliceScannerTest, Scan) {
  EXPECT_EQ(scan_text("[<foo _ bar>]"), "foo_bar");
  EXPECT_EQ(scan_text("( [<a b>] )"), "(ab)");
  EXPECT_EQ(scan_text("x + [<a b>] * y"), "x + ab * y");
  EXPECT_EQ(scan_text("{ f([<a b>], [<c d>]) }"), "{f (ab , cd)}");
  EXPECT_EQ(scan_text("[<a>] [[<b c>]]"), "a [bc]");
}

// Tokens outside of splice units are left as they are
TEST(SpliceScannerTest, NonInterference) {
  const spl::token_stream ts = lex("let v: Vec<u8> = [<make_ vec>](1, [2]);");
  const spl::token_stream result = spl::scan(ts, ts);

  ASSERT_EQ(result.size(), ts.size());
  for (size_t i = 0; i < ts.size(); ++i)
  {
    if (spl::is_splice_open(ts[i]))
    {
      EXPECT_TRUE(result[i].is_ident("make_vec"));
      continue;
    }
    EXPECT_TRUE(spl::equal(result[i], ts[i])) << "token #" << i;
    EXPECT_EQ(result[i].location, ts[i].location) << "token #" << i;
  }
}

TEST(SpliceScannerTest, OutputLength) {
  const spl::token_stream ts = lex("a [<b c d>] e [<f>] g");
  ASSERT_EQ(spl::count_tokens(ts), 13);

  const spl::token_stream result = spl::scan(ts, ts);
  EXPECT_EQ(result.size(), 5);
  EXPECT_EQ(spl::count_tokens(result), 5);
}

TEST(SpliceScannerTest, NoUnits) {
  const spl::token_stream ts = lex("fn f(x: [u8; 4]) -> <T as Tr>::Out {}");
  EXPECT_TRUE(spl::equal(spl::scan(ts, ts), ts));
}

// A failing unit aborts the whole scan
TEST(SpliceScannerTest, FailureInNestedGroup) {
  const spl::token_stream ts = lex("{ [<a b>] ( [<c:bogus>] ) }");
  try
  {
    [[maybe_unused]] const auto result = spl::scan(ts, ts);
    FAIL() << "splice_error expected";
  }
  catch (const spl::splice_error &exn)
  {
    EXPECT_EQ(exn.code(), spl::splice_errc::unknown_modifier);
  }
}

} // anonymous namespace
