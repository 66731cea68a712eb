#include "barcode/bar_pattern.hpp"

#include <cctype>
#include <utility>

#include "esp_log.h"

namespace barcode {

namespace {
constexpr char kLogTag[] = "bar_pattern";
}  // namespace

bool ContainsOnly(std::string_view text, std::string_view allowed) {
  if (text.empty()) {
    return false;
  }
  for (char ch : text) {
    if (allowed.find(ch) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

bool IsDigitString(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char ch : text) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      return false;
    }
  }
  return true;
}

std::string ToUpperAscii(std::string_view text) {
  std::string upper(text);
  for (char& ch : upper) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return upper;
}

esp_err_t StringToDigits(std::string_view text, std::vector<uint8_t>* digits) {
  if (digits == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  std::vector<uint8_t> values;
  values.reserve(text.size());
  for (char ch : text) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      ESP_LOGW(kLogTag, "Not a digit: '%c' (0x%02X)", ch, static_cast<uint8_t>(ch));
      return ESP_ERR_INVALID_ARG;
    }
    values.push_back(static_cast<uint8_t>(ch - '0'));
  }

  *digits = std::move(values);
  return ESP_OK;
}

esp_err_t BarsToModules(std::string_view bars, std::vector<uint8_t>* modules) {
  if (bars.empty() || !ContainsOnly(bars, "01")) {
    ESP_LOGW(kLogTag, "Rejected bar pattern of %zu tokens", bars.size());
    return ESP_ERR_INVALID_ARG;
  }
  return StringToDigits(bars, modules);
}

std::string JoinPatterns(const std::vector<std::string_view>& patterns, char separator) {
  size_t total = 0;
  for (const auto& pattern : patterns) {
    total += pattern.size() + 1;
  }

  std::string joined;
  joined.reserve(total);
  for (size_t i = 0; i < patterns.size(); ++i) {
    if (i > 0) {
      joined.push_back(separator);
    }
    joined.append(patterns[i].data(), patterns[i].size());
  }
  return joined;
}

}  // namespace barcode
