#include "barcode/bar_pattern.hpp"

#include "gtest/gtest.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace {

using barcode::BarsToModules;
using barcode::ContainsOnly;
using barcode::IsDigitString;
using barcode::JoinPatterns;
using barcode::StringToDigits;
using barcode::ToUpperAscii;

TEST(BarPatternTest, ContainsOnlyRequiresEveryCharacter) {
  EXPECT_TRUE(ContainsOnly("12-34", "0123456789-"));
  EXPECT_FALSE(ContainsOnly("12 34", "0123456789-"));
  EXPECT_FALSE(ContainsOnly("", "0123456789"));
  EXPECT_FALSE(ContainsOnly("1", ""));
}

TEST(BarPatternTest, IsDigitString) {
  EXPECT_TRUE(IsDigitString("0123456789"));
  EXPECT_FALSE(IsDigitString(""));
  EXPECT_FALSE(IsDigitString("12a"));
  EXPECT_FALSE(IsDigitString("-1"));
}

TEST(BarPatternTest, ToUpperAsciiLeavesNonLettersAlone) {
  EXPECT_EQ("ABC-12$", ToUpperAscii("abC-12$"));
  EXPECT_EQ("", ToUpperAscii(""));
}

TEST(BarPatternTest, StringToDigitsConvertsEachCharacter) {
  std::vector<uint8_t> digits;
  ASSERT_EQ(ESP_OK, StringToDigits("0907", &digits));
  EXPECT_EQ((std::vector<uint8_t>{0, 9, 0, 7}), digits);

  ASSERT_EQ(ESP_OK, StringToDigits("", &digits));
  EXPECT_TRUE(digits.empty());
}

TEST(BarPatternTest, StringToDigitsRejectsNonDigits) {
  std::vector<uint8_t> digits = {4, 2};
  EXPECT_EQ(ESP_ERR_INVALID_ARG, StringToDigits("12x", &digits));
  EXPECT_EQ((std::vector<uint8_t>{4, 2}), digits);
  EXPECT_EQ(ESP_ERR_INVALID_ARG, StringToDigits("12", nullptr));
}

TEST(BarPatternTest, BarsToModules) {
  std::vector<uint8_t> modules;
  ASSERT_EQ(ESP_OK, BarsToModules("1011", &modules));
  EXPECT_EQ((std::vector<uint8_t>{1, 0, 1, 1}), modules);

  EXPECT_EQ(ESP_ERR_INVALID_ARG, BarsToModules("", &modules));
  EXPECT_EQ(ESP_ERR_INVALID_ARG, BarsToModules("1021", &modules));
}

TEST(BarPatternTest, JoinPatternsPutsSeparatorBetweenNeighbours) {
  EXPECT_EQ("101011", JoinPatterns({"101", "11"}, '0'));
  EXPECT_EQ("111", JoinPatterns({"111"}, '0'));
  EXPECT_EQ("", JoinPatterns(std::vector<std::string_view>{}, '0'));
  EXPECT_EQ("1|0|1", JoinPatterns({"1", "0", "1"}, '|'));
}

}  // namespace
