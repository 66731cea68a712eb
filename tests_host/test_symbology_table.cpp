/**
 * @file test_symbology_table.cpp
 * @brief Unit tests for the symbology pattern tables
 *
 * Coverage: digits, symbols, start/stop characters, pattern widths,
 * error handling, tables without data.
 */

#include "barcode/symbology_table.hpp"
#include "gtest/gtest.h"

#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace barcode;

namespace {

std::string Lookup(Symbology symbology, char symbol) {
  std::string_view pattern;
  if (LookupPattern(symbology, symbol, &pattern) != ESP_OK) {
    return "";
  }
  return std::string(pattern);
}

// ============================================================================
// CODABAR DIGITS
// ============================================================================

TEST(CodabarTableTest, LookupDigits) {
  EXPECT_EQ("101010011", Lookup(Symbology::kCodabar, '0'));
  EXPECT_EQ("101011001", Lookup(Symbology::kCodabar, '1'));
  EXPECT_EQ("101001011", Lookup(Symbology::kCodabar, '2'));
  EXPECT_EQ("110010101", Lookup(Symbology::kCodabar, '3'));
  EXPECT_EQ("101101001", Lookup(Symbology::kCodabar, '4'));
  EXPECT_EQ("110101001", Lookup(Symbology::kCodabar, '5'));
  EXPECT_EQ("100101011", Lookup(Symbology::kCodabar, '6'));
  EXPECT_EQ("100101101", Lookup(Symbology::kCodabar, '7'));
  EXPECT_EQ("100110101", Lookup(Symbology::kCodabar, '8'));
  EXPECT_EQ("110100101", Lookup(Symbology::kCodabar, '9'));
}

// ============================================================================
// CODABAR SYMBOLS
// ============================================================================

TEST(CodabarTableTest, LookupSymbols) {
  EXPECT_EQ("101001101", Lookup(Symbology::kCodabar, '-'));
  EXPECT_EQ("101100101", Lookup(Symbology::kCodabar, '$'));
  EXPECT_EQ("1101011011", Lookup(Symbology::kCodabar, ':'));
  EXPECT_EQ("1101101011", Lookup(Symbology::kCodabar, '/'));
  EXPECT_EQ("1101101101", Lookup(Symbology::kCodabar, '.'));
  EXPECT_EQ("1011011011", Lookup(Symbology::kCodabar, '+'));
}

// ============================================================================
// CODABAR START/STOP
// ============================================================================

TEST(CodabarTableTest, LookupStartStopCharacters) {
  EXPECT_EQ("1011001001", Lookup(Symbology::kCodabar, 'A'));
  EXPECT_EQ("1001001011", Lookup(Symbology::kCodabar, 'B'));
  EXPECT_EQ("1010010011", Lookup(Symbology::kCodabar, 'C'));
  EXPECT_EQ("1010011001", Lookup(Symbology::kCodabar, 'D'));
}

TEST(CodabarTableTest, PatternWidthsAreFixedPerCharacter) {
  for (char ch : std::string("0123456789-$")) {
    EXPECT_EQ(9u, Lookup(Symbology::kCodabar, ch).size()) << "char " << ch;
  }
  for (char ch : std::string(":/.+ABCD")) {
    EXPECT_EQ(10u, Lookup(Symbology::kCodabar, ch).size()) << "char " << ch;
  }
}

TEST(CodabarTableTest, EveryPatternStartsAndEndsWithBar) {
  for (char ch : std::string("0123456789-$:/.+ABCD")) {
    const std::string pattern = Lookup(Symbology::kCodabar, ch);
    ASSERT_FALSE(pattern.empty()) << "char " << ch;
    EXPECT_EQ('1', pattern.front()) << "char " << ch;
    EXPECT_EQ('1', pattern.back()) << "char " << ch;
  }
}

// ============================================================================
// ERROR HANDLING
// ============================================================================

TEST(CodabarTableTest, LookupUnmappedCharacter) {
  std::string_view pattern = "unchanged";
  EXPECT_EQ(ESP_ERR_NOT_FOUND, LookupPattern(Symbology::kCodabar, 'E', &pattern));
  EXPECT_EQ(ESP_ERR_NOT_FOUND, LookupPattern(Symbology::kCodabar, ' ', &pattern));
  EXPECT_EQ(ESP_ERR_NOT_FOUND, LookupPattern(Symbology::kCodabar, '\0', &pattern));
  EXPECT_EQ("unchanged", pattern);
}

TEST(CodabarTableTest, LookupIsCaseSensitive) {
  // Normalization upper-cases before lookup; the table holds upper-case only.
  std::string_view pattern;
  EXPECT_EQ(ESP_ERR_NOT_FOUND, LookupPattern(Symbology::kCodabar, 'a', &pattern));
  EXPECT_FALSE(IsMapped(Symbology::kCodabar, 'a'));
  EXPECT_TRUE(IsMapped(Symbology::kCodabar, 'A'));
}

TEST(CodabarTableTest, LookupRejectsNullOutput) {
  EXPECT_EQ(ESP_ERR_INVALID_ARG, LookupPattern(Symbology::kCodabar, '0', nullptr));
}

TEST(UpcTableTest, LookupIsNotSupported) {
  std::string_view pattern;
  EXPECT_EQ(ESP_ERR_NOT_SUPPORTED, LookupPattern(Symbology::kUpc, '0', &pattern));
  EXPECT_FALSE(IsMapped(Symbology::kUpc, '0'));
  EXPECT_EQ(0u, GetTableSize(Symbology::kUpc));
}

// ============================================================================
// TABLE SIZE & SHARING
// ============================================================================

TEST(CodabarTableTest, TableSizeIsCorrect) {
  // 10 digits + 6 symbols + 4 start/stop
  EXPECT_EQ(20u, GetTableSize(Symbology::kCodabar));
}

TEST(CodabarTableTest, ConcurrentLookupsAgree) {
  std::vector<std::thread> readers;
  std::vector<std::string> results(8);
  for (size_t i = 0; i < results.size(); ++i) {
    readers.emplace_back([&results, i]() {
      std::string joined;
      for (int round = 0; round < 100; ++round) {
        joined = Lookup(Symbology::kCodabar, '7') + Lookup(Symbology::kCodabar, 'D');
      }
      results[i] = joined;
    });
  }
  for (auto& reader : readers) {
    reader.join();
  }
  for (const auto& result : results) {
    EXPECT_EQ("1001011011010011001", result);
  }
}

}  // namespace
