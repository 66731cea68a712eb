#pragma once

/**
 * @file barcode.hpp
 * @brief Validated barcode value and the encoded record handed to a renderer
 *
 * PIPELINE:
 * =========
 * raw text ──Validate──▶ ──Normalize──▶ normalized data ──Encode──▶ bar pattern
 *
 * Each stage either fully succeeds or the whole operation fails. A Barcode is
 * only constructed from input that passed validation; it is immutable after
 * construction. The bar pattern and caption are recomputed on every call, so
 * concurrent readers need no synchronization.
 *
 * USAGE EXAMPLE:
 * ==============
 * @code
 * barcode::BarcodeOptions options;
 * options.text = "Order 1234";
 *
 * barcode::EncodedBarcode encoded;
 * esp_err_t err = barcode::EncodeBarcode("1234", barcode::Symbology::kCodabar,
 *                                        options, &encoded);
 * if (err == ESP_OK) {
 *   // encoded.bar_pattern     "1011001001010101100101010010110..."
 *   // encoded.display_text    "Order 1234"
 *   // encoded.normalized_data "A1234A"
 *   // encoded.symbology_name  "codabar"
 * }
 * @endcode
 */

#include <memory>
#include <optional>
#include <string>

#include "barcode/symbology.hpp"

extern "C" {
#include "esp_err.h"
}

namespace barcode {

/**
 * @brief Recognized barcode options
 */
struct BarcodeOptions {
  std::optional<std::string> text;  // Caption override (replaces the symbology default)
};

/**
 * @brief Output record consumed by the renderer collaborator
 */
struct EncodedBarcode {
  std::string bar_pattern;      // '1' = bar module, '0' = space module
  std::string display_text;     // Caption under the bars
  std::string normalized_data;  // Data actually encoded
  std::string symbology_name;   // "codabar", "upc"
};

/**
 * @class Barcode
 * @brief Immutable barcode value built from validated input
 */
class Barcode {
  // Only Create() can name this, so only Create() can construct a Barcode.
  struct CreateKey {
    explicit CreateKey() = default;
  };

 public:
  /**
   * @brief Validate and normalize raw input into a barcode value
   *
   * @param raw User-supplied data
   * @param symbology Variant whose grammar applies
   * @param options Caption override
   * @param[out] out Receives the new value; untouched on failure
   * @return ESP_OK, ESP_ERR_INVALID_ARG if raw fails the grammar or out is null
   */
  static esp_err_t Create(const std::string& raw, Symbology symbology,
                          const BarcodeOptions& options, std::unique_ptr<Barcode>* out);

  Barcode(CreateKey key, std::string raw_data, std::string normalized_data, Symbology symbology,
          BarcodeOptions options);

  Barcode(const Barcode&) = default;
  Barcode& operator=(const Barcode&) = delete;

  const std::string& GetRawData() const { return raw_data_; }
  const std::string& GetNormalizedData() const { return normalized_data_; }
  Symbology GetSymbology() const { return symbology_; }
  const BarcodeOptions& GetOptions() const { return options_; }

  /** @brief Symbology name ("codabar", "upc") */
  const char* GetName() const { return GetSymbologyName(symbology_); }

  /**
   * @brief Encode the normalized data
   *
   * @param[out] bars '1'/'0' pattern; untouched on failure
   * @return ESP_OK
   *         ESP_ERR_NOT_SUPPORTED if the symbology has no encoder (UPC)
   *         ESP_ERR_INVALID_STATE if the table is missing a character that passed
   *         validation (validator/table mismatch)
   *         ESP_ERR_INVALID_ARG if bars is null
   */
  esp_err_t Encode(std::string* bars) const;

  /**
   * @brief Caption: options.text if set, else the symbology default
   *
   * Codabar drops its start/stop characters: data "1234" → "1234", not "A1234A".
   */
  std::string GetDisplayText() const;

 private:
  const std::string raw_data_;
  const std::string normalized_data_;
  const Symbology symbology_;
  const BarcodeOptions options_;
};

/**
 * @brief One-shot build of the renderer record: create, encode, caption
 *
 * @param[out] out Filled only when every stage succeeds
 * @return First failing stage's code (see Barcode::Create and Barcode::Encode)
 */
esp_err_t EncodeBarcode(const std::string& raw, Symbology symbology, const BarcodeOptions& options,
                        EncodedBarcode* out);

}  // namespace barcode
