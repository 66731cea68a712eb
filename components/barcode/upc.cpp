#include "barcode/upc.hpp"

#include "barcode/bar_pattern.hpp"
#include "esp_log.h"

namespace barcode {
namespace upc {

namespace {
constexpr char kLogTag[] = "upc";
}  // namespace

bool IsValid(std::string_view raw) {
  return (raw.size() == kPayloadDigits || raw.size() == kFullDigits) && IsDigitString(raw);
}

esp_err_t Normalize(std::string_view raw, std::string* normalized) {
  if (normalized == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  if (!IsValid(raw)) {
    ESP_LOGW(kLogTag, "Not a valid upc value: '%.*s' (need %zu or %zu digits)",
             static_cast<int>(raw.size()), raw.data(), kPayloadDigits, kFullDigits);
    return ESP_ERR_INVALID_ARG;
  }
  normalized->assign(raw.data(), raw.size());
  return ESP_OK;
}

esp_err_t Encode(std::string_view normalized, std::string* bars) {
  (void)bars;
  ESP_LOGE(kLogTag, "UPC bar encoding is not implemented (data '%.*s')",
           static_cast<int>(normalized.size()), normalized.data());
  return ESP_ERR_NOT_SUPPORTED;
}

esp_err_t ComputeChecksum(std::string_view payload, uint8_t* check_digit) {
  if (check_digit == nullptr || payload.size() != kPayloadDigits || !IsDigitString(payload)) {
    return ESP_ERR_INVALID_ARG;
  }
  ESP_LOGE(kLogTag, "UPC check digit computation is not implemented");
  return ESP_ERR_NOT_SUPPORTED;
}

std::string DefaultDisplayText(std::string_view normalized) {
  return std::string(normalized);
}

}  // namespace upc
}  // namespace barcode
