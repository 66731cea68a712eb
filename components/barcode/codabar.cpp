#include "barcode/codabar.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "barcode/bar_pattern.hpp"
#include "barcode/symbology_table.hpp"
#include "esp_log.h"

namespace barcode {
namespace codabar {

namespace {
constexpr char kLogTag[] = "codabar";
}  // namespace

bool IsValid(std::string_view raw) {
  return ContainsOnly(raw, kDataAlphabet);
}

esp_err_t Normalize(std::string_view raw, std::string* normalized) {
  if (normalized == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  if (!IsValid(raw)) {
    ESP_LOGW(kLogTag, "Not a valid codabar value: '%.*s'", static_cast<int>(raw.size()), raw.data());
    return ESP_ERR_INVALID_ARG;
  }

  std::string framed;
  framed.reserve(raw.size() + 2);
  framed.push_back(kGuardCharacter);
  framed += ToUpperAscii(raw);
  framed.push_back(kGuardCharacter);

  *normalized = std::move(framed);
  return ESP_OK;
}

esp_err_t Encode(std::string_view normalized, std::string* bars) {
  if (bars == nullptr || normalized.empty()) {
    return ESP_ERR_INVALID_ARG;
  }

  std::vector<std::string_view> patterns;
  patterns.reserve(normalized.size());
  for (char ch : normalized) {
    std::string_view pattern;
    const esp_err_t err = LookupPattern(Symbology::kCodabar, ch, &pattern);
    if (err != ESP_OK) {
      ESP_LOGE(kLogTag, "Encode failed: '%c' (0x%02X) has no codabar pattern", ch,
               static_cast<uint8_t>(ch));
      return err;
    }
    patterns.push_back(pattern);
  }

  *bars = JoinPatterns(patterns, kSpaceModule);
  ESP_LOGI(kLogTag, "Encoded '%.*s' → %zu modules", static_cast<int>(normalized.size()),
           normalized.data(), bars->size());
  return ESP_OK;
}

std::string DefaultDisplayText(std::string_view normalized) {
  std::string text;
  text.reserve(normalized.size());
  for (char ch : normalized) {
    if (std::string_view(kGuardAlphabet).find(ch) == std::string_view::npos) {
      text.push_back(ch);
    }
  }
  return text;
}

}  // namespace codabar
}  // namespace barcode
