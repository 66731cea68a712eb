/**
 * @file symbology_table.cpp
 * @brief Bar pattern tables
 *
 * Codabar widths: digits, '-' and '$' are 9 modules; ':', '/', '.', '+' and
 * the start/stop characters A-D are 10 modules. Every pattern begins and ends
 * with a bar, so a stream joined with single space modules splits back into
 * its patterns without ambiguity.
 */

#include "barcode/symbology_table.hpp"

#include <array>
#include <cstdint>

#include "esp_log.h"

namespace barcode {

namespace {
constexpr char kLogTag[] = "symbology_table";

// ========================================================================
// CODABAR (20 patterns)
// ========================================================================
constexpr std::array<SymbolPattern, 20> kCodabarPatterns = {{
    // Digits
    {'0', "101010011"},
    {'1', "101011001"},
    {'2', "101001011"},
    {'3', "110010101"},
    {'4', "101101001"},
    {'5', "110101001"},
    {'6', "100101011"},
    {'7', "100101101"},
    {'8', "100110101"},
    {'9', "110100101"},
    // Symbols
    {'-', "101001101"},
    {'$', "101100101"},
    {':', "1101011011"},
    {'/', "1101101011"},
    {'.', "1101101101"},
    {'+', "1011011011"},
    // Start/stop
    {'A', "1011001001"},
    {'B', "1001001011"},
    {'C', "1010010011"},
    {'D', "1010011001"},
}};

const SymbolPattern* FindEntry(Symbology symbology, char symbol) {
  switch (symbology) {
    case Symbology::kCodabar:
      for (const auto& entry : kCodabarPatterns) {
        if (entry.symbol == symbol) {
          return &entry;
        }
      }
      return nullptr;
    case Symbology::kUpc:
      return nullptr;
  }
  return nullptr;
}

bool HasTable(Symbology symbology) {
  switch (symbology) {
    case Symbology::kCodabar:
      return true;
    case Symbology::kUpc:
      return false;
  }
  return false;
}

}  // namespace

esp_err_t LookupPattern(Symbology symbology, char symbol, std::string_view* pattern) {
  if (pattern == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  if (!HasTable(symbology)) {
    ESP_LOGE(kLogTag, "No pattern table for %s", GetSymbologyName(symbology));
    return ESP_ERR_NOT_SUPPORTED;
  }

  const SymbolPattern* entry = FindEntry(symbology, symbol);
  if (entry == nullptr) {
    ESP_LOGD(kLogTag, "Lookup failed: '%c' (0x%02X) not in %s table", symbol,
             static_cast<uint8_t>(symbol), GetSymbologyName(symbology));
    return ESP_ERR_NOT_FOUND;
  }

  ESP_LOGD(kLogTag, "Lookup success: '%c' → '%s'", symbol, entry->bars);
  *pattern = entry->bars;
  return ESP_OK;
}

bool IsMapped(Symbology symbology, char symbol) {
  return FindEntry(symbology, symbol) != nullptr;
}

size_t GetTableSize(Symbology symbology) {
  switch (symbology) {
    case Symbology::kCodabar:
      return kCodabarPatterns.size();
    case Symbology::kUpc:
      return 0;
  }
  return 0;
}

}  // namespace barcode
