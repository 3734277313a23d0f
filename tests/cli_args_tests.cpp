#include "utilities/cli_args.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace vidseal;

TEST(CliArgsTest, FlagsAreCollected) {
  std::vector<std::string> args{"a.json", "b.json", "--tolerance", "3",
                                "--threshold", "0.2"};
  auto flags = parseFlags(args, 2, {"--tolerance", "--threshold"});
  EXPECT_EQ(flags.at("--tolerance"), "3");
  EXPECT_EQ(flags.at("--threshold"), "0.2");
  EXPECT_TRUE(parseFlags(args, 6, {"--tolerance"}).empty());
}

TEST(CliArgsTest, TrailingFlagWithoutValueIsRejected) {
  std::vector<std::string> args{"a.json", "b.json", "--tolerance"};
  EXPECT_THROW(parseFlags(args, 2, {"--tolerance"}), std::invalid_argument);

  std::vector<std::string> unknown{"a.json", "b.json", "--bogus", "1"};
  EXPECT_THROW(parseFlags(unknown, 2, {"--tolerance"}), std::invalid_argument);
}

TEST(CliArgsTest, DimensionsMustBePositive) {
  EXPECT_EQ(parsePositive("480", "height"), 480u);
  EXPECT_EQ(parsePositive("4294967295", "height"), 4294967295u);
  EXPECT_THROW(parsePositive("-1", "height"), std::invalid_argument);
  EXPECT_THROW(parsePositive("0", "height"), std::invalid_argument);
  EXPECT_THROW(parsePositive("4294967296", "height"), std::invalid_argument);
  EXPECT_THROW(parsePositive("12px", "height"), std::invalid_argument);
  EXPECT_THROW(parsePositive("", "height"), std::invalid_argument);
  EXPECT_THROW(parsePositive("99999999999999999999999", "height"),
               std::invalid_argument);
}

TEST(CliArgsTest, ToleranceAndThreshold) {
  EXPECT_EQ(parseNonNegative("0", "tolerance"), 0);
  EXPECT_EQ(parseNonNegative("12", "tolerance"), 12);
  EXPECT_THROW(parseNonNegative("-3", "tolerance"), std::invalid_argument);
  EXPECT_THROW(parseNonNegative("2147483648", "tolerance"),
               std::invalid_argument);

  EXPECT_DOUBLE_EQ(parseRatio("0.25", "threshold"), 0.25);
  EXPECT_DOUBLE_EQ(parseRatio("0", "threshold"), 0.0);
  EXPECT_THROW(parseRatio("-0.1", "threshold"), std::invalid_argument);
  EXPECT_THROW(parseRatio("0.1x", "threshold"), std::invalid_argument);
  EXPECT_THROW(parseRatio("nan", "threshold"), std::invalid_argument);
  EXPECT_THROW(parseRatio("abc", "threshold"), std::invalid_argument);
}
