/**
 * @file codabar.hpp
 * @brief Codabar symbology: validation, guard framing, encoding, caption
 *
 * Codabar is self-framing: every symbol stream begins and ends with one of
 * the four start/stop characters A, B, C or D so a scanner can find the
 * symbol boundaries and reading direction. The table carries all four; this
 * encoder always frames with kGuardCharacter.
 *
 * Data alphabet: 0-9 - $ : . + /
 *
 * Example:
 *   Normalize("0")  → "A0A"
 *   Encode("A0A")   → "1011001001" "0" "101010011" "0" "1011001001"
 *   DefaultDisplayText("A0A") → "0"
 */

#pragma once

#include <string>
#include <string_view>

extern "C" {
#include "esp_err.h"
}

namespace barcode {
namespace codabar {

/// Characters accepted in raw input (start/stop letters excluded).
constexpr char kDataAlphabet[] = "0123456789-$:.+/";

/// Start/stop characters defined by the symbology.
constexpr char kGuardAlphabet[] = "ABCD";

/// Start/stop character used to frame every encoded payload.
constexpr char kGuardCharacter = 'A';

/**
 * @brief Check raw input: one or more characters, all from kDataAlphabet
 *
 *   IsValid("1234")   → true
 *   IsValid("$1.50")  → true
 *   IsValid("12 34")  → false
 *   IsValid("A12A")   → false (guards are added by Normalize)
 *   IsValid("")       → false
 */
bool IsValid(std::string_view raw);

/**
 * @brief Upper-case raw input and frame it with kGuardCharacter
 *
 * @param[out] normalized kGuardCharacter + upper(raw) + kGuardCharacter
 * @return ESP_OK, ESP_ERR_INVALID_ARG if raw is not valid Codabar data
 */
esp_err_t Normalize(std::string_view raw, std::string* normalized);

/**
 * @brief Map each character through the Codabar table and join with one space module
 *
 * Output length is the sum of pattern widths plus (size - 1) separator modules.
 *
 * @return ESP_OK, ESP_ERR_NOT_FOUND if a character has no pattern,
 *         ESP_ERR_INVALID_ARG if normalized is empty or bars is null
 */
esp_err_t Encode(std::string_view normalized, std::string* bars);

/** @brief normalized with every start/stop character (A-D) removed */
std::string DefaultDisplayText(std::string_view normalized);

}  // namespace codabar
}  // namespace barcode
