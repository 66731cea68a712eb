/**
 * @file upc.hpp
 * @brief UPC-A symbology: validation only
 *
 * Input is 11 digits (check digit to be computed) or 12 digits (check digit
 * supplied). Normalization is the identity.
 *
 * Check digit computation and the UPC bar encoding are not implemented: both
 * return ESP_ERR_NOT_SUPPORTED instead of an empty or partial result.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include "esp_err.h"
}

namespace barcode {
namespace upc {

/// Digits without the check digit.
constexpr size_t kPayloadDigits = 11;

/// Digits including the check digit.
constexpr size_t kFullDigits = 12;

/**
 * @brief Check raw input: exactly 11 or 12 ASCII digits
 *
 *   IsValid("03600029145")   → true
 *   IsValid("036000291452")  → true
 *   IsValid("0360002914")    → false (10 digits)
 *   IsValid("03600029145X")  → false
 */
bool IsValid(std::string_view raw);

/**
 * @brief Identity normalization after validation
 *
 * @return ESP_OK, ESP_ERR_INVALID_ARG if raw is not valid UPC data
 */
esp_err_t Normalize(std::string_view raw, std::string* normalized);

/**
 * @brief UPC bar encoding
 *
 * @return ESP_ERR_NOT_SUPPORTED (no bar mapping defined); bars is untouched
 */
esp_err_t Encode(std::string_view normalized, std::string* bars);

/**
 * @brief Compute the check digit for an 11-digit payload
 *
 * @return ESP_ERR_INVALID_ARG if payload is not 11 digits,
 *         otherwise ESP_ERR_NOT_SUPPORTED (no algorithm defined)
 */
esp_err_t ComputeChecksum(std::string_view payload, uint8_t* check_digit);

/** @brief Caption for UPC data: normalized unchanged */
std::string DefaultDisplayText(std::string_view normalized);

}  // namespace upc
}  // namespace barcode
