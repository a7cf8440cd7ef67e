#include "bpp/Structs/errors.hpp"
#include "experiments/readData/readData.h"
#include <gtest/gtest.h>

using namespace bpp;

namespace {
std::vector<Instance> parse(const std::string &content) {
  Parser readData;
  return readData.parse(content, "data");
}
} // namespace

TEST(ParserDecimalPlaces, CountsFractionalDigits) {
  EXPECT_EQ(Parser::decimalPlaces("42"), 0);
  EXPECT_EQ(Parser::decimalPlaces("36.6"), 1);
  EXPECT_EQ(Parser::decimalPlaces("0.125"), 3);
  EXPECT_EQ(Parser::decimalPlaces("-3"), 0);
  EXPECT_FALSE(Parser::decimalPlaces("abc").has_value());
  EXPECT_FALSE(Parser::decimalPlaces("1.").has_value());
  EXPECT_FALSE(Parser::decimalPlaces(".5").has_value());
  EXPECT_FALSE(Parser::decimalPlaces("1e3").has_value());
}

TEST(ParserSimple, CountFirstLayout) {
  auto instances = parse("3 10\n1 2 3\n");
  ASSERT_EQ(instances.size(), 1u);
  EXPECT_EQ(instances[0].name, "data");
  EXPECT_EQ(instances[0].capacity, 10);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{1, 2, 3}));
  EXPECT_FALSE(instances[0].knownOptimalBins.has_value());
}

TEST(ParserSimple, CapacityFirstLayout) {
  auto instances = parse("10 3\n1 2 3\n");
  ASSERT_EQ(instances.size(), 1u);
  EXPECT_EQ(instances[0].capacity, 10);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{1, 2, 3}));
}

TEST(ParserSimple, SizesMaySpanLines) {
  auto instances = parse("4 20\n5\n6 7\n8\n");
  ASSERT_EQ(instances.size(), 1u);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{5, 6, 7, 8}));
}

TEST(ParserSimple, CommentLinesAreIgnored) {
  auto instances = parse("# small instance\n2 10\n# sizes\n4 6\n");
  ASSERT_EQ(instances.size(), 1u);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{4, 6}));
}

TEST(ParserScaling, IntegerFileIsNotScaled) {
  auto instances = parse("3 60\n22 17 45\n");
  EXPECT_EQ(instances[0].capacity, 60);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{22, 17, 45}));
}

TEST(ParserScaling, DecimalItemAndCapacity) {
  auto instances = parse("1 100.0\n36.6\n");
  EXPECT_EQ(instances[0].capacity, 1000);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{366}));
}

TEST(ParserScaling, MixedPrecisionUsesTheFinestScale) {
  auto instances = parse("2 100\n36.6 50\n");
  EXPECT_EQ(instances[0].capacity, 1000);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{366, 500}));
}

TEST(ParserScaling, TooManyDecimalsAreRejected) {
  EXPECT_THROW(parse("1 10\n1.1234567\n"), MalformedInputError);
}

TEST(ParserScaling, ScaleTokenShiftsDigits) {
  EXPECT_EQ(Parser::scaleToken({"1.25", 1}, 3), 1250);
  EXPECT_EQ(Parser::scaleToken({"7", 1}, 2), 700);
  EXPECT_THROW(Parser::scaleToken({"-1", 1}, 0), MalformedInputError);
  EXPECT_THROW(Parser::scaleToken({"3000000", 1}, 6), MalformedInputError);
}

TEST(ParserErrors, EmptyInput) {
  EXPECT_THROW(parse(""), EmptyInputError);
  EXPECT_THROW(parse("   \n\n"), EmptyInputError);
  EXPECT_THROW(parse("# only a comment\n"), EmptyInputError);
}

TEST(ParserErrors, DeclaredCountDoesNotMatch) {
  EXPECT_THROW(parse("5 100\n10 20 30 40\n"), MalformedInputError);
  EXPECT_THROW(parse("2 100\n10 20 30\n"), MalformedInputError);
}

TEST(ParserErrors, MalformedErrorsAreParseErrors) {
  EXPECT_THROW(parse("5 100\n10 20 30 40\n"), ParseError);
}

TEST(ParserErrors, ItemLargerThanCapacity) {
  EXPECT_THROW(parse("2 10\n5 11\n"), InfeasibleItemError);
}

TEST(ParserErrors, ZeroCapacityOrSize) {
  EXPECT_THROW(parse("2 0\n0 0\n"), MalformedInputError);
  EXPECT_THROW(parse("2 10\n0 5\n"), MalformedInputError);
}

TEST(ParserErrors, ReportsTheOffendingLine) {
  try {
    parse("3 10\n1\nx 2\n");
    FAIL() << "expected MalformedInputError";
  } catch (const MalformedInputError &e) {
    EXPECT_EQ(e.line(), 3u);
    EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
  }
}

TEST(ParserBinPack, ReadsAllInstances) {
  const std::string content = "2\n"
                              " u1\n"
                              " 100 3 2\n"
                              " 50\n 50\n 40\n"
                              " u2\n"
                              " 120 2\n"
                              " 60 60\n";
  auto instances = parse(content);
  ASSERT_EQ(instances.size(), 2u);
  EXPECT_EQ(instances[0].name, "data_u1");
  EXPECT_EQ(instances[0].capacity, 100);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{50, 50, 40}));
  EXPECT_EQ(instances[0].knownOptimalBins, 2);
  EXPECT_EQ(instances[1].name, "data_u2");
  EXPECT_EQ(instances[1].capacity, 120);
  EXPECT_FALSE(instances[1].knownOptimalBins.has_value());
}

TEST(ParserBinPack, OneScaleForTheWholeFile) {
  const std::string content = "2\nu1\n100 2\n50 40\nu2\n120.5 2\n60 60\n";
  auto instances = parse(content);
  ASSERT_EQ(instances.size(), 2u);
  EXPECT_EQ(instances[0].capacity, 1000);
  EXPECT_EQ(instances[0].sizes, (std::vector<int>{500, 400}));
  EXPECT_EQ(instances[1].capacity, 1205);
  EXPECT_EQ(instances[1].sizes, (std::vector<int>{600, 600}));
}

TEST(ParserBinPack, TooFewSizes) {
  EXPECT_THROW(parse("1\nu1\n100 3\n50 40\n"), MalformedInputError);
}

TEST(ParserBinPack, TooManySizes) {
  EXPECT_THROW(parse("1\nu1\n100 2\n50 40 30\n"), MalformedInputError);
}

TEST(ParserBinPack, MissingInstance) {
  EXPECT_THROW(parse("2\nu1\n100 2\n50 40\n"), MalformedInputError);
}

TEST(ParserBinPack, TrailingContent) {
  EXPECT_THROW(parse("1\nu1\n100 2\n50 40\nu2\n"), MalformedInputError);
}

TEST(ParserBinPack, InfeasibleItem) {
  EXPECT_THROW(parse("1\nu1\n100 2\n50 140\n"), InfeasibleItemError);
}

TEST(ParserBinPack, ParsingTwiceGivesTheSameInstances) {
  const std::string content = "1\nu1\n100.5 3 2\n50.25 40 30\n";
  auto first = parse(content);
  auto second = parse(content);
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t i = 0; i < first.size(); i++) {
    EXPECT_EQ(first[i].name, second[i].name);
    EXPECT_EQ(first[i].capacity, second[i].capacity);
    EXPECT_EQ(first[i].sizes, second[i].sizes);
    EXPECT_EQ(first[i].knownOptimalBins, second[i].knownOptimalBins);
  }
  EXPECT_EQ(first[0].capacity, 10050);
  EXPECT_EQ(first[0].sizes, (std::vector<int>{5025, 4000, 3000}));
}

TEST(ParserFiles, MissingFileThrows) {
  Parser readData;
  EXPECT_THROW(readData.readInstances("/nonexistent/dir/instance.txt"),
               std::runtime_error);
}
