#include "barcode/barcode.hpp"

#include <memory>
#include <utility>

#include "esp_log.h"

namespace barcode {

namespace {
constexpr char kLogTag[] = "barcode";
}  // namespace

Barcode::Barcode(CreateKey /*key*/, std::string raw_data, std::string normalized_data,
                 Symbology symbology, BarcodeOptions options)
    : raw_data_(std::move(raw_data)),
      normalized_data_(std::move(normalized_data)),
      symbology_(symbology),
      options_(std::move(options)) {}

esp_err_t Barcode::Create(const std::string& raw, Symbology symbology,
                          const BarcodeOptions& options, std::unique_ptr<Barcode>* out) {
  if (out == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  if (!Validate(symbology, raw)) {
    ESP_LOGW(kLogTag, "Rejected %s value '%s'", GetSymbologyName(symbology), raw.c_str());
    return ESP_ERR_INVALID_ARG;
  }

  std::string normalized;
  const esp_err_t err = Normalize(symbology, raw, &normalized);
  if (err != ESP_OK) {
    return err;
  }

  ESP_LOGD(kLogTag, "Created %s barcode: '%s' → '%s'", GetSymbologyName(symbology), raw.c_str(),
           normalized.c_str());
  *out = std::make_unique<Barcode>(CreateKey{}, raw, std::move(normalized), symbology, options);
  return ESP_OK;
}

esp_err_t Barcode::Encode(std::string* bars) const {
  if (bars == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  const esp_err_t err = barcode::Encode(symbology_, normalized_data_, bars);
  if (err == ESP_ERR_NOT_FOUND) {
    // Normalized data passed validation, so every character must be in the table.
    ESP_LOGE(kLogTag, "Invariant violation: validated %s data '%s' has unmapped characters",
             GetName(), normalized_data_.c_str());
    return ESP_ERR_INVALID_STATE;
  }
  return err;
}

std::string Barcode::GetDisplayText() const {
  if (options_.text.has_value()) {
    return *options_.text;
  }
  return DefaultDisplayText(symbology_, normalized_data_);
}

esp_err_t EncodeBarcode(const std::string& raw, Symbology symbology, const BarcodeOptions& options,
                        EncodedBarcode* out) {
  if (out == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  std::unique_ptr<Barcode> value;
  esp_err_t err = Barcode::Create(raw, symbology, options, &value);
  if (err != ESP_OK) {
    return err;
  }

  std::string bars;
  err = value->Encode(&bars);
  if (err != ESP_OK) {
    return err;
  }

  out->bar_pattern = std::move(bars);
  out->display_text = value->GetDisplayText();
  out->normalized_data = value->GetNormalizedData();
  out->symbology_name = value->GetName();
  return ESP_OK;
}

}  // namespace barcode
