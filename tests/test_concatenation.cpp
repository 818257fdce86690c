#include "splice/concatenation.hpp"
#include "splice/lexer.hpp"
#include "splice/splice_scanner.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <optional>
#include <string>

namespace {

spl::token_stream
lex(std::string_view text)
{ return spl::lexer {}.tokenize(text); }

// Resolve the splice unit written at the beginning of the invocation
spl::token
paste_unit(const spl::token_stream &invocation)
{
  const spl::splice_unit unit = spl::delimit_splice_unit(invocation, 0);
  const spl::source_location &where = invocation[0].location;
  return spl::concatenate(spl::parse_fragments(unit.body(), where), where,
                          invocation);
}

std::string
paste_text(std::string_view text)
{
  const spl::token result = paste_unit(lex(text));
  EXPECT_TRUE(result.is_ident());
  return std::string {result.text.begin(), result.text.end()};
}

std::optional<spl::splice_error>
catch_splice_error(const std::function<void()> &fn)
{
  try
  {
    fn();
  }
  catch (const spl::splice_error &exn)
  {
    return exn;
  }
  return std::nullopt;
}

std::optional<spl::splice_error>
paste_error(std::string_view text)
{
  const spl::token_stream ts = lex(text);
  return catch_splice_error([&] { paste_unit(ts); });
}


TEST(ConcatenationTest, Modifiers) {
  EXPECT_EQ(spl::find_modifier("lower"), spl::modifier_kind::lower);
  EXPECT_EQ(spl::find_modifier("upper"), spl::modifier_kind::upper);
  EXPECT_EQ(spl::find_modifier("span"), spl::modifier_kind::span);
  EXPECT_FALSE(spl::find_modifier("camel").has_value());
  EXPECT_FALSE(spl::find_modifier("").has_value());

  EXPECT_EQ(spl::modifier_name(spl::modifier_kind::upper), "upper");
}

TEST(ConcatenationTest, ParseFragments) {
  const spl::token_stream ts = lex("[<foo:lower bar 42:span(x)>]");
  const spl::splice_unit unit = spl::delimit_splice_unit(ts, 0);
  const auto fragments = spl::parse_fragments(unit.body(), ts[0].location);

  ASSERT_EQ(fragments.size(), 3);
  EXPECT_EQ(fragments[0].text, "foo");
  ASSERT_EQ(fragments[0].modifiers.size(), 1);
  EXPECT_EQ(fragments[0].modifiers[0].kind, spl::modifier_kind::lower);

  EXPECT_EQ(fragments[1].text, "bar");
  EXPECT_TRUE(fragments[1].modifiers.empty());

  EXPECT_EQ(fragments[2].text, "42");
  ASSERT_EQ(fragments[2].modifiers.size(), 1);
  EXPECT_EQ(fragments[2].modifiers[0].kind, spl::modifier_kind::span);
  ASSERT_TRUE(fragments[2].modifiers[0].reference.has_value());
  EXPECT_EQ(*fragments[2].modifiers[0].reference, "x");
}

TEST(ConcatenationTest, FragmentsOfInvisibleGroups) {
  using spl::delimiter_kind;

  const spl::token_stream body {
    spl::make_ident("get_"),
    spl::make_group(delimiter_kind::none, {spl::make_ident("Name")}),
    spl::make_punct(':'),
    spl::make_ident("lower"),
  };
  const auto fragments = spl::parse_fragments(body, {});
  ASSERT_EQ(fragments.size(), 2);
  EXPECT_EQ(fragments[1].text, "Name");
  EXPECT_EQ(fragments[1].modifiers.size(), 1);
}

TEST(ConcatenationTest, LiteralFragmentText) {
  using spl::literal_kind;

  EXPECT_EQ(spl::literal_fragment_text(spl::make_literal(literal_kind::integer, "42")), "42");
  EXPECT_EQ(spl::literal_fragment_text(spl::make_literal(literal_kind::integer, "0x1F")), "0x1F");
  EXPECT_EQ(spl::literal_fragment_text(spl::make_literal(literal_kind::integer, "7u8")), "7u8");
  EXPECT_EQ(spl::literal_fragment_text(spl::make_literal(literal_kind::string, "\"foo\"")), "foo");

  EXPECT_THROW(spl::literal_fragment_text(spl::make_literal(literal_kind::string, "\"a b\"")),
               spl::splice_error);
  EXPECT_THROW(spl::literal_fragment_text(spl::make_literal(literal_kind::floating, "1.5")),
               spl::splice_error);
  EXPECT_THROW(spl::literal_fragment_text(spl::make_literal(literal_kind::character, "'c'")),
               spl::splice_error);
  EXPECT_THROW(spl::literal_fragment_text(spl::make_literal(literal_kind::byte_string, "b\"x\"")),
               spl::splice_error);
}

TEST(ConcatenationTest, ValidIdentifiers) {
  EXPECT_TRUE(spl::is_valid_identifier("foo_bar"));
  EXPECT_TRUE(spl::is_valid_identifier("_1"));
  EXPECT_TRUE(spl::is_valid_identifier("item42"));
  EXPECT_FALSE(spl::is_valid_identifier(""));
  EXPECT_FALSE(spl::is_valid_identifier("42item"));
  EXPECT_FALSE(spl::is_valid_identifier("a-b"));
}

// Test concatenation of fragments
TEST(ConcatenationTest, Concatenate) {
  EXPECT_EQ(paste_text("[<foo _ bar>]"), "foo_bar");
  EXPECT_EQ(paste_text("[<item 42>]"), "item42");
  EXPECT_EQ(paste_text("[<some_ \"foo\" _fn 100>]"), "some_foo_fn100");
  EXPECT_EQ(paste_text("[<r#type _id>]"), "type_id");
  EXPECT_EQ(paste_text("[<single>]"), "single");
}

TEST(ConcatenationTest, CaseModifiers) {
  EXPECT_EQ(paste_text("[<FOO:lower>]"), "foo");
  EXPECT_EQ(paste_text("[<foo:upper>]"), "FOO");
  EXPECT_EQ(paste_text("[<get_ MyName:lower>]"), "get_myname");
  EXPECT_EQ(paste_text("[<ab_ Cd:upper _Ef>]"), "ab_CD_Ef");
}

// Test case folding of non-ASCII identifier fragments
TEST(ConcatenationTest, UnicodeCaseModifiers) {
  EXPECT_EQ(paste_text("[<ÄRGER:lower>]"), "ärger");
  EXPECT_EQ(paste_text("[<ärger:upper>]"), "ÄRGER");
  EXPECT_EQ(paste_text("[<get_ Übung:lower>]"), "get_übung");
}

// Of conflicting case modifiers the last one wins
TEST(ConcatenationTest, LastCaseModifierWins) {
  EXPECT_EQ(paste_text("[<Foo:lower:upper>]"), paste_text("[<Foo:upper>]"));
  EXPECT_EQ(paste_text("[<Foo:upper:lower>]"), paste_text("[<Foo:lower>]"));
}

TEST(ConcatenationTest, ResultLocation) {
  const spl::token_stream ts = lex("[<foo bar>]");
  EXPECT_EQ(paste_unit(ts).location, ts[0].location);
}

TEST(ConcatenationTest, SpanModifier) {
  const spl::token_stream ts = lex("[<foo bar:span>]");
  const spl::token &bar = ts[0].children[2];
  ASSERT_TRUE(bar.is_ident("bar"));

  const spl::token result = paste_unit(ts);
  EXPECT_EQ(result.text, "foobar");
  EXPECT_EQ(result.location, bar.location);
}

TEST(ConcatenationTest, SpanModifierComposesWithCase) {
  const spl::token_stream ts = lex("[<Foo:lower:span bar>]");
  const spl::token result = paste_unit(ts);
  EXPECT_EQ(result.text, "foobar");
  EXPECT_EQ(result.location, ts[0].children[1].location);
}

TEST(ConcatenationTest, SpanReference) {
  // The unit comes first, the referenced identifier follows it
  const spl::token_stream ts = lex("[<get_ x:span(target)>] fn target()");
  const spl::token result = paste_unit(ts);
  EXPECT_EQ(result.text, "get_x");
  EXPECT_EQ(result.location, ts[2].location);
}

// Test error reporting
TEST(ConcatenationTest, EmptyUnit) {
  const spl::token_stream ts = lex("[<>]");
  const auto exn = catch_splice_error([&] { paste_unit(ts); });
  ASSERT_TRUE(exn.has_value());
  EXPECT_EQ(exn->code(), spl::splice_errc::empty_splice_unit);
  EXPECT_EQ(exn->location(), ts[0].location);
}

TEST(ConcatenationTest, UnknownModifier) {
  const spl::token_stream ts = lex("[<foo:camel>]");
  const auto exn = catch_splice_error([&] { paste_unit(ts); });
  ASSERT_TRUE(exn.has_value());
  EXPECT_EQ(exn->code(), spl::splice_errc::unknown_modifier);
  // Reported at the modifier name
  EXPECT_EQ(exn->location(), ts[0].children[3].location);
}

TEST(ConcatenationTest, UnsupportedFragments) {
  for (const char *text : {"[<foo 1.5>]", "[<foo \"a-b\">]", "[<foo + bar>]",
                           "[<foo (bar)>]", "[<foo 'c'>]", "[<42>]"})
  {
    const auto exn = paste_error(text);
    ASSERT_TRUE(exn.has_value()) << text;
    EXPECT_EQ(exn->code(), spl::splice_errc::unsupported_fragment_kind) << text;
  }
}

TEST(ConcatenationTest, UnsupportedFragmentLocation) {
  const spl::token_stream ts = lex("[<foo 1.5>]");
  const auto exn = catch_splice_error([&] { paste_unit(ts); });
  ASSERT_TRUE(exn.has_value());
  EXPECT_EQ(exn->location(), ts[0].children[2].location);
}

TEST(ConcatenationTest, MalformedModifiers) {
  for (const char *text : {"[<:lower foo>]", "[<foo:>]", "[<foo:1>]",
                           "[<foo:span(a b)>]", "[<a:span b:span>]",
                           "[<foo [<bar>]>]"})
  {
    const auto exn = paste_error(text);
    ASSERT_TRUE(exn.has_value()) << text;
    EXPECT_EQ(exn->code(), spl::splice_errc::malformed_splice_syntax) << text;
  }
}

TEST(ConcatenationTest, UnresolvedSpanReference) {
  const spl::token_stream ts = lex("[<foo:span(missing)>] fn bar()");
  const auto exn = catch_splice_error([&] { paste_unit(ts); });
  ASSERT_TRUE(exn.has_value());
  EXPECT_EQ(exn->code(), spl::splice_errc::unresolved_span_reference);
  EXPECT_EQ(exn->location(), ts[0].children[3].location);
}

// A reference never resolves to its own argument
TEST(ConcatenationTest, SpanReferenceSkipsSpliceUnits) {
  const auto exn = paste_error("[<foo:span(foo)>]");
  ASSERT_TRUE(exn.has_value());
  EXPECT_EQ(exn->code(), spl::splice_errc::unresolved_span_reference);
}

TEST(ConcatenationTest, ErrorMessageNamesKind) {
  const auto exn = paste_error("[<foo:camel>]");
  ASSERT_TRUE(exn.has_value());
  EXPECT_EQ(std::string {exn->what()}, "unknown modifier: `camel`");
}

} // anonymous namespace
