#include "libjsonselect/parse.hpp"      // libjsonselect::Parser
#include "libjsonselect/jsonselect.hpp" // libjsonselect::parse libjsonselect::to_string
#include "libjsonselect/lex.hpp"        // libjsonselect::Lexer
#include <gtest/gtest.h>                // EXPEXT_* TEST_F testing::Test
#include <string_view>                  // string_view
#include <variant>                      // std::get std::holds_alternative

class ParserTest : public testing::Test {
protected:
  void expect_to_string(std::string_view query, std::string_view want) {
    // `parse` convenience function.
    auto selectors{libjsonselect::parse(query)};
    EXPECT_EQ(libjsonselect::to_string(selectors), want);

    // `Parser.parse()` from a string.
    libjsonselect::Parser parser{};
    EXPECT_EQ(libjsonselect::to_string(parser.parse(query)), want);

    // The canonical form is itself a valid path with the same meaning.
    EXPECT_EQ(libjsonselect::to_string(libjsonselect::parse(want)), want);
  }
};

TEST_F(ParserTest, JustRoot) { expect_to_string("$", "$"); }

TEST_F(ParserTest, RootDotProperty) {
  expect_to_string("$.thing", "$['thing']");
}

TEST_F(ParserTest, ChainedDotProperties) {
  expect_to_string("$.foo.bar", "$['foo']['bar']");
}

TEST_F(ParserTest, SingleQuotedProperty) {
  expect_to_string("$['thing']", "$['thing']");
}

TEST_F(ParserTest, DoubleQuotedProperty) {
  expect_to_string("$[\"thing\"]", "$['thing']");
}

TEST_F(ParserTest, QuotedPropertyWithNonIdentChars) {
  expect_to_string("$[\"thing{!%\"]", "$['thing{!%']");
}

TEST_F(ParserTest, EmptyQuotedProperty) { expect_to_string("$['']", "$['']"); }

TEST_F(ParserTest, UnicodeEscape) {
  expect_to_string("$['a\\u0041']", "$['aA']");
}

TEST_F(ParserTest, LowercaseHexEscape) {
  expect_to_string("$['\\u00e9']", "$['\xc3\xa9']");
}

TEST_F(ParserTest, SurrogatePairEscape) {
  expect_to_string("$['\\uD83D\\uDE00']", "$['\xf0\x9f\x98\x80']");
}

TEST_F(ParserTest, EscapedSingleQuote) {
  expect_to_string("$['it\\'s']", "$['it\\'s']");
}

TEST_F(ParserTest, SingleQuoteInDoubleQuotedString) {
  expect_to_string("$[\"it's\"]", "$['it\\'s']");
}

TEST_F(ParserTest, EscapedDoubleQuote) {
  expect_to_string("$[\"say \\\"hi\\\"\"]", "$['say \"hi\"']");
}

TEST_F(ParserTest, EscapedControlCharacters) {
  expect_to_string("$['\\n\\t\\u0001']", "$['\\n\\t\\u0001']");
}

TEST_F(ParserTest, EscapedSolidusAndBackslash) {
  expect_to_string("$['\\/\\\\']", "$['/\\\\']");
}

TEST_F(ParserTest, RootIndex) { expect_to_string("$[1]", "$[1]"); }
TEST_F(ParserTest, NegativeIndex) { expect_to_string("$[-1]", "$[-1]"); }
TEST_F(ParserTest, NegativeZeroIndex) { expect_to_string("$[-0]", "$[0]"); }

TEST_F(ParserTest, LargestIndex) {
  expect_to_string("$[9223372036854775807]", "$[9223372036854775807]");
}

TEST_F(ParserTest, SmallestIndex) {
  expect_to_string("$[-9223372036854775808]", "$[-9223372036854775808]");
}

TEST_F(ParserTest, RootSlice) { expect_to_string("$[1:-1]", "$[1:-1:1]"); }

TEST_F(ParserTest, SliceWithStep) {
  expect_to_string("$[1:-1:2]", "$[1:-1:2]");
}

TEST_F(ParserTest, SliceWithEmptyStart) {
  expect_to_string("$[:-1]", "$[:-1:1]");
}

TEST_F(ParserTest, SliceWithEmptyStop) { expect_to_string("$[1:]", "$[1::1]"); }
TEST_F(ParserTest, EmptySlice) { expect_to_string("$[:]", "$[::1]"); }
TEST_F(ParserTest, EmptySliceWithTwoColons) { expect_to_string("$[::]", "$[::1]"); }
TEST_F(ParserTest, ReverseSlice) { expect_to_string("$[::-1]", "$[::-1]"); }
TEST_F(ParserTest, ZeroStepSlice) { expect_to_string("$[0:3:0]", "$[0:3:0]"); }
TEST_F(ParserTest, RootDotWild) { expect_to_string("$.*", "$[*]"); }
TEST_F(ParserTest, RootBracketWild) { expect_to_string("$[*]", "$[*]"); }
TEST_F(ParserTest, SelectorList) { expect_to_string("$[1,2]", "$[1, 2]"); }

TEST_F(ParserTest, SelectorListWithSlice) {
  expect_to_string("$[1,5:-1:1]", "$[1, 5:-1:1]");
}

TEST_F(ParserTest, SelectorListOfNamesAndIndices) {
  expect_to_string("$['a',\"b\", 0]", "$['a', 'b', 0]");
}

TEST_F(ParserTest, DescendantName) { expect_to_string("$..foo", "$..['foo']"); }
TEST_F(ParserTest, DescendantWild) { expect_to_string("$..*", "$..[*]"); }

TEST_F(ParserTest, DescendantBracketedWild) {
  expect_to_string("$..[*]", "$..[*]");
}

TEST_F(ParserTest, DescendantUnion) {
  expect_to_string("$..[0, 'a']", "$..[0, 'a']");
}

TEST_F(ParserTest, DescendantThenChild) {
  expect_to_string("$..book[0].title", "$..['book'][0]['title']");
}

TEST_F(ParserTest, InsignificantWhitespace) {
  expect_to_string(" $ .foo [ 1 , 2 ] [ 1 : 2 : 3 ] ",
      "$['foo'][1, 2][1:2:3]");
}

TEST_F(ParserTest, ShorthandNameStartingWithDigit) {
  expect_to_string("$.1", "$['1']");
}

TEST_F(ParserTest, SelectorTypes) {
  const auto selectors{libjsonselect::parse("$.foo[1:2]..*")};
  ASSERT_EQ(selectors.size(), 4);

  EXPECT_TRUE(std::holds_alternative<libjsonselect::RootSelector>(selectors[0]));

  const auto& name{std::get<libjsonselect::ChildNameSelector>(selectors[1])};
  EXPECT_EQ(name.name, "foo");
  EXPECT_EQ(name.token.index, 2);

  const auto& union_{std::get<libjsonselect::UnionSelector>(selectors[2])};
  ASSERT_EQ(union_.elements.size(), 1);
  const auto& slice{std::get<libjsonselect::SliceElement>(union_.elements[0])};
  EXPECT_EQ(slice.start.value_or(-1), 1);
  EXPECT_EQ(slice.stop.value_or(-1), 2);
  EXPECT_FALSE(slice.step.has_value());

  const auto& descendant{
      std::get<libjsonselect::DescendantSelector>(selectors[3])};
  EXPECT_TRUE(std::holds_alternative<libjsonselect::WildChildSelector>(
      descendant.target));
}

TEST_F(ParserTest, ParseLexerTokens) {
  libjsonselect::Lexer lexer{"$.a[0]"};
  lexer.run();

  libjsonselect::Parser parser{};
  const auto selectors{parser.parse(lexer.tokens())};
  EXPECT_EQ(libjsonselect::to_string(selectors), "$['a'][0]");

  // The same parser can be used again.
  EXPECT_EQ(libjsonselect::to_string(parser.parse("$.b")), "$['b']");
}

TEST_F(ParserTest, Version) {
  EXPECT_EQ(libjsonselect::VERSION, LIBJSONSELECT_VERSION);
  EXPECT_FALSE(libjsonselect::VERSION.empty());
}
