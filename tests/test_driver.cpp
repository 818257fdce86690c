#include "splice/driver.hpp"
#include "splice/lexer.hpp"
#include "splice/logging.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace {

spl::token_stream
lex(std::string_view text)
{ return spl::lexer {}.tokenize(text); }

// Run a whole source through the driver, as `splice <file>` does
bool
process(std::string_view text, const spl::expander_table &table,
        const spl::output_options &opts, std::string &output)
{
  std::istringstream in {std::string {text}};
  std::ostringstream out;
  const bool ok = spl::process_source(in, "<test>", table, opts, out);
  output = out.str();
  return ok;
}


TEST(DriverTest, ExpandAndWrite) {
  const spl::builtin_expanders table;

  std::ostringstream oss;
  EXPECT_TRUE(spl::expand_and_write(lex("let paste! { [<a b>] } = 1;"), table,
                                    {}, oss));
  EXPECT_EQ(oss.str(), "let ab = 1 ;\n");

  std::ostringstream dumped;
  spl::output_options opts;
  opts.dump_tokens = true;
  EXPECT_TRUE(spl::expand_and_write(lex("paste! { [<a b>] }"), table, opts,
                                    dumped));
  EXPECT_EQ(dumped.str(), "[group ~ [ident ab] ~]\n");
}

// Test that the first failure is thrown without `keep_going`
TEST(DriverTest, FailureThrows) {
  const spl::builtin_expanders table;
  std::string output;
  EXPECT_THROW(process("paste! { [<a:bogus>] } x", table, {}, output),
               spl::splice_error);
  EXPECT_EQ(output, "");
}

// Test that with `keep_going` every failure is reported and nothing is written
TEST(DriverTest, KeepGoingWithholdsOutput) {
  const spl::builtin_expanders table;
  spl::output_options opts;
  opts.keep_going = true;

  std::string output;
  testing::internal::CaptureStderr();
  const bool ok = process("paste! { [<a:bogus>] } paste! { [<b c>] } "
                          "concat_idents!(a)",
                          table, opts, output);
  const std::string log = testing::internal::GetCapturedStderr();

  EXPECT_FALSE(ok);
  EXPECT_EQ(output, "");
  EXPECT_NE(log.find("unknown modifier: `bogus`"), std::string::npos);
  EXPECT_NE(log.find("concat_idents"), std::string::npos);
  EXPECT_NE(log.find("2 invocation(s) failed to expand"), std::string::npos);

  // A clean source goes through
  EXPECT_TRUE(process("paste! { [<b c>] }", table, opts, output));
  EXPECT_EQ(output, "bc\n");
}

// Test restriction of expansion to the selected macros
TEST(DriverTest, SelectExpanders) {
  const spl::builtin_expanders builtins;

  spl::expander_table selected;
  spl::select_expanders(builtins, {"paste", "paste"}, selected);
  EXPECT_EQ(selected.names(), std::vector<std::string> {"paste"});

  std::string output;
  EXPECT_TRUE(process("paste! { [<a b>] } concat_idents!(c, d)", selected, {},
                      output));
  EXPECT_EQ(output, "ab concat_idents ! (c , d)\n");

  spl::expander_table other;
  EXPECT_THROW(spl::select_expanders(builtins, {"paste", "stringify"}, other),
               spl::expansion_error);
}

} // anonymous namespace
