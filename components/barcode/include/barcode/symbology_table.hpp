/**
 * @file symbology_table.hpp
 * @brief Character → bar pattern tables for each symbology
 *
 * Pattern format: String of '1' (bar) and '0' (space) modules
 * Example (Codabar): '0' → "101010011", 'A' → "1011001001"
 *
 * Tables are constexpr arrays with static storage: no initialization,
 * no teardown, safe for concurrent reads from any thread.
 *
 * Lookup outside a table's character set fails with ESP_ERR_NOT_FOUND.
 * Symbologies without a table (UPC) fail with ESP_ERR_NOT_SUPPORTED.
 */

#pragma once

#include <cstddef>
#include <string_view>

#include "barcode/symbology.hpp"

extern "C" {
#include "esp_err.h"
}

namespace barcode {

/**
 * @brief One table entry
 */
struct SymbolPattern {
  char symbol;       // Input character (upper-case for letters)
  const char* bars;  // Module pattern, e.g. "101010011"
};

/**
 * @brief Lookup the bar pattern for a character
 *
 * @param symbology Table to search
 * @param symbol Character to encode (case-sensitive: tables hold upper-case letters)
 * @param[out] pattern View into static storage, valid for the life of the process
 * @return ESP_OK on success
 *         ESP_ERR_NOT_FOUND if symbol has no entry
 *         ESP_ERR_NOT_SUPPORTED if the symbology has no table
 *         ESP_ERR_INVALID_ARG if pattern is null
 *
 * Examples:
 *   LookupPattern(kCodabar, '0', &p)  → ESP_OK, p == "101010011"
 *   LookupPattern(kCodabar, 'A', &p)  → ESP_OK, p == "1011001001"
 *   LookupPattern(kCodabar, 'E', &p)  → ESP_ERR_NOT_FOUND
 *   LookupPattern(kUpc, '0', &p)      → ESP_ERR_NOT_SUPPORTED
 *
 * Thread-safe: Yes
 */
esp_err_t LookupPattern(Symbology symbology, char symbol, std::string_view* pattern);

/** @brief True if the symbology table has an entry for symbol */
bool IsMapped(Symbology symbology, char symbol);

/** @brief Number of entries in the symbology table (0 when it has none) */
size_t GetTableSize(Symbology symbology);

}  // namespace barcode
