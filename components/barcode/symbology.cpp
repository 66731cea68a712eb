#include "barcode/symbology.hpp"

#include "barcode/bar_pattern.hpp"
#include "barcode/codabar.hpp"
#include "barcode/upc.hpp"
#include "esp_log.h"

namespace barcode {

namespace {
constexpr char kLogTag[] = "symbology";
}  // namespace

const char* GetSymbologyName(Symbology symbology) {
  switch (symbology) {
    case Symbology::kCodabar:
      return "codabar";
    case Symbology::kUpc:
      return "upc";
  }
  return "unknown";
}

esp_err_t ParseSymbology(std::string_view name, Symbology* symbology) {
  if (symbology == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  const std::string upper = ToUpperAscii(name);
  if (upper == "CODABAR") {
    *symbology = Symbology::kCodabar;
    return ESP_OK;
  }
  if (upper == "UPC") {
    *symbology = Symbology::kUpc;
    return ESP_OK;
  }
  if (upper == "EAN") {
    ESP_LOGE(kLogTag, "EAN barcodes are not implemented");
    return ESP_ERR_NOT_SUPPORTED;
  }

  ESP_LOGW(kLogTag, "Unknown symbology '%.*s'", static_cast<int>(name.size()), name.data());
  return ESP_ERR_INVALID_ARG;
}

bool Validate(Symbology symbology, std::string_view raw) {
  switch (symbology) {
    case Symbology::kCodabar:
      return codabar::IsValid(raw);
    case Symbology::kUpc:
      return upc::IsValid(raw);
  }
  return false;
}

esp_err_t Normalize(Symbology symbology, std::string_view raw, std::string* normalized) {
  switch (symbology) {
    case Symbology::kCodabar:
      return codabar::Normalize(raw, normalized);
    case Symbology::kUpc:
      return upc::Normalize(raw, normalized);
  }
  return ESP_ERR_INVALID_ARG;
}

esp_err_t Encode(Symbology symbology, std::string_view normalized, std::string* bars) {
  switch (symbology) {
    case Symbology::kCodabar:
      return codabar::Encode(normalized, bars);
    case Symbology::kUpc:
      return upc::Encode(normalized, bars);
  }
  return ESP_ERR_INVALID_ARG;
}

std::string DefaultDisplayText(Symbology symbology, std::string_view normalized) {
  switch (symbology) {
    case Symbology::kCodabar:
      return codabar::DefaultDisplayText(normalized);
    case Symbology::kUpc:
      return upc::DefaultDisplayText(normalized);
  }
  return std::string(normalized);
}

}  // namespace barcode
