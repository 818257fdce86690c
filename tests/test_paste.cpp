#include "splice/lexer.hpp"
#include "splice/logging.hpp"
#include "splice/paste.hpp"
#include "splice/splice_scanner.hpp"
#include "splice/token_printer.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace {

spl::token_stream
lex(std::string_view text)
{ return spl::lexer {}.tokenize(text); }

std::string
paste_text(std::string_view text)
{ return spl::to_string(spl::paste(lex(text))); }

std::string
dump_text(const spl::token_stream &ts)
{
  std::ostringstream oss;
  spl::dump(oss, ts);
  return oss.str();
}

// `<invisible group a>::[<b c>]`
spl::token_stream
path_with_invisible_segment()
{
  spl::token_stream ts = lex("::[<b c>]");
  ts.insert(ts.begin(), spl::make_group(spl::delimiter_kind::none,
                                        {spl::make_ident("a")}));
  return ts;
}


TEST(PasteTest, Paste) {
  EXPECT_EQ(paste_text("fn [<some_ \"foo\" _fn 100>]() -> u32 { 100 }"),
            "fn some_foo_fn100 () -> u32 {100}");
}

TEST(PasteTest, GeneratedItems) {
  EXPECT_EQ(paste_text("pub(crate) const fn [<BR_OK:lower:span>]() -> u32 "
                       "{ [<binder_ BR_OK:span>] }"),
            "pub (crate) const fn br_ok () -> u32 {binder_BR_OK}");
}

// Input free of splice units is returned as is
TEST(PasteTest, NoMarkers) {
  const spl::token_stream ts = lex("fn f(x: [u8; 4]) -> Vec<u8> { x.to_vec() }");
  const spl::token_stream result = spl::paste(ts);
  ASSERT_TRUE(spl::equal(result, ts));
  for (size_t i = 0; i < ts.size(); ++i)
    EXPECT_EQ(result[i].location, ts[i].location);
}

TEST(PasteTest, Idempotence) {
  const spl::token_stream once = spl::paste(lex("mod [<a b>] { fn [<c:upper>]() {} }"));
  EXPECT_FALSE(spl::contains_splice_units(once));
  EXPECT_TRUE(spl::equal(spl::paste(once), once));
}

TEST(PasteTest, SpanReference) {
  const spl::token_stream ts = lex("struct Foo; impl [<Foo Ext>] for [<Foo:span(Foo)>] {}");
  const spl::token_stream result = spl::paste(ts);

  ASSERT_EQ(result.size(), 8);
  EXPECT_TRUE(result[4].is_ident("FooExt"));
  EXPECT_EQ(result[4].location, ts[4].location);
  EXPECT_TRUE(result[6].is_ident("Foo"));
  EXPECT_EQ(result[6].location, ts[1].location);
}

TEST(PasteTest, FlattenInvisibleSegments) {
  EXPECT_EQ(dump_text(spl::paste(path_with_invisible_segment())),
            "[ident a] [punct : joint] [punct :] [ident bc]");
}

TEST(PasteTest, FlattenNestedLevels) {
  const spl::token_stream ts {
    spl::make_group(spl::delimiter_kind::brace, path_with_invisible_segment()),
  };
  const spl::token_stream result = spl::paste(ts);
  ASSERT_EQ(result.size(), 1);
  ASSERT_EQ(result[0].children.size(), 4);
  EXPECT_TRUE(result[0].children[0].is_ident("a"));
}

TEST(PasteTest, NoPathFlattenFlag) {
  spl::global_flags.emplace("NoPathFlatten");
  const spl::token_stream result = spl::paste(path_with_invisible_segment());
  spl::global_flags.erase("NoPathFlatten");

  ASSERT_EQ(result.size(), 4);
  EXPECT_TRUE(result[0].is_group(spl::delimiter_kind::none));
  EXPECT_TRUE(result[3].is_ident("bc"));
}

// Nothing is returned on failure
TEST(PasteTest, Failure) {
  EXPECT_THROW(paste_text("fn [<foo bar]() {}"), spl::splice_error);
  EXPECT_THROW(paste_text("fn ok() {} fn [<a:bogus>]() {}"), spl::splice_error);
}

} // anonymous namespace
