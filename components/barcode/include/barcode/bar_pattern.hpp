/**
 * @file bar_pattern.hpp
 * @brief String and digit helpers shared by the symbology variants
 *
 * Bar pattern format: String of '1' (bar module) and '0' (space module)
 * Example: '0' (Codabar) → "101010011"
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include "esp_err.h"
}

namespace barcode {

/// Token for a bar module in a pattern string.
constexpr char kBarModule = '1';

/// Token for a space module in a pattern string.
constexpr char kSpaceModule = '0';

/**
 * @brief Check that text is non-empty and made only of characters from allowed
 *
 * Every character must match; a single allowed character somewhere in the
 * text is not enough.
 *
 * Examples:
 *   ContainsOnly("12-34", "0123456789-")  → true
 *   ContainsOnly("12 34", "0123456789-")  → false
 *   ContainsOnly("", "0123456789")        → false
 */
bool ContainsOnly(std::string_view text, std::string_view allowed);

/** @brief True if text is non-empty and every character is an ASCII digit */
bool IsDigitString(std::string_view text);

/** @brief ASCII upper-case copy of text (non-letters pass through) */
std::string ToUpperAscii(std::string_view text);

/**
 * @brief Convert a string of ASCII digits to their integer values
 *
 * @param text Digit string (e.g., "0123")
 * @param[out] digits Receives {0, 1, 2, 3}; untouched on failure
 * @return ESP_OK, ESP_ERR_INVALID_ARG if digits is null or text holds a non-digit
 */
esp_err_t StringToDigits(std::string_view text, std::vector<uint8_t>* digits);

/**
 * @brief Convert a bar pattern to the 0/1 module sequence a raster renderer draws
 *
 * @param bars Pattern of '1'/'0' tokens
 * @param[out] modules One entry per module (1 = filled, 0 = empty)
 * @return ESP_OK, ESP_ERR_INVALID_ARG if bars is empty or holds anything but '0'/'1'
 */
esp_err_t BarsToModules(std::string_view bars, std::vector<uint8_t>* modules);

/**
 * @brief Concatenate patterns with one separator token between neighbours
 *
 * JoinPatterns({"101", "11"}, '0') → "101011"
 */
std::string JoinPatterns(const std::vector<std::string_view>& patterns, char separator);

}  // namespace barcode
