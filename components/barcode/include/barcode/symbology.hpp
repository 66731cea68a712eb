#pragma once

/**
 * @file symbology.hpp
 * @brief Supported linear symbologies and per-variant capability dispatch
 *
 * Every symbology implements the same four capabilities:
 *   Validate            raw text against the character/length grammar
 *   Normalize           raw text into the data actually encoded
 *   Encode              normalized data into a '1'/'0' bar pattern
 *   DefaultDisplayText  caption shown under the bars when no override is given
 *
 * Dispatch is a switch over the closed Symbology enum. Adding a variant means
 * adding an enumerator and a case in each function below; -Wswitch reports any
 * case that is missed.
 *
 * ERROR CODES:
 * ============
 * ESP_ERR_INVALID_ARG   raw data fails the symbology grammar (InvalidInput)
 * ESP_ERR_NOT_FOUND     normalized data holds a character missing from the table
 * ESP_ERR_NOT_SUPPORTED variant has no defined algorithm yet (NotImplemented)
 */

#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include "esp_err.h"
}

namespace barcode {

enum class Symbology : uint8_t {
  kCodabar = 0,
  kUpc = 1,
};

/**
 * @brief Logical name used in captions, filenames and JSON ("codabar", "upc")
 */
const char* GetSymbologyName(Symbology symbology);

/**
 * @brief Parse a symbology name (case-insensitive)
 *
 * @param name Name such as "codabar" or "UPC"
 * @param[out] symbology Receives the parsed variant on success
 * @return ESP_OK
 *         ESP_ERR_NOT_SUPPORTED for "ean" (known name, no encoder yet)
 *         ESP_ERR_INVALID_ARG for any other name or null output
 */
esp_err_t ParseSymbology(std::string_view name, Symbology* symbology);

/** @brief Check raw input against the symbology grammar */
bool Validate(Symbology symbology, std::string_view raw);

/**
 * @brief Validate and normalize raw input
 *
 * @param[out] normalized Data to encode; untouched on failure
 * @return ESP_OK, ESP_ERR_INVALID_ARG if raw fails Validate()
 */
esp_err_t Normalize(Symbology symbology, std::string_view raw, std::string* normalized);

/**
 * @brief Encode normalized data into a bar pattern
 *
 * @param[out] bars '1'/'0' pattern, left to right; untouched on failure
 * @return ESP_OK, ESP_ERR_NOT_FOUND, ESP_ERR_NOT_SUPPORTED or ESP_ERR_INVALID_ARG
 */
esp_err_t Encode(Symbology symbology, std::string_view normalized, std::string* bars);

/** @brief Caption derived from normalized data when no text override is set */
std::string DefaultDisplayText(Symbology symbology, std::string_view normalized);

}  // namespace barcode
