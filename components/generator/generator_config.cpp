#include "generator/generator_config.hpp"

#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include "barcode/bar_pattern.hpp"
#include "barcode/barcode_json.hpp"
#include "esp_log.h"

namespace generator {

namespace {
constexpr char kLogTag[] = "generator";

void SetError(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

bool ParseDpi(const std::string& text, uint32_t* dpi) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long parsed = std::strtoul(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return false;
  }
  if (parsed < kMinDpi || parsed > kMaxDpi) {
    return false;
  }
  *dpi = static_cast<uint32_t>(parsed);
  return true;
}

}  // namespace

esp_err_t ParseArguments(const std::vector<std::string>& args, GeneratorConfig* config,
                         std::string* error) {
  if (config == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  GeneratorConfig parsed = *config;
  bool have_value = false;
  bool options_done = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    auto next_value = [&](std::string* value) -> bool {
      if (i + 1 >= args.size()) {
        SetError(error, "Missing value for " + arg);
        return false;
      }
      *value = args[++i];
      return true;
    };

    // "--" ends option parsing so any data may start with '-' (Codabar "-$").
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }

    // No option starts with "-<digit>", so "-12" is data.
    const bool positional = options_done || arg.size() < 2 || arg[0] != '-' ||
                            std::isdigit(static_cast<unsigned char>(arg[1]));
    if (positional) {
      if (have_value) {
        SetError(error, "Unexpected argument: " + arg);
        return ESP_ERR_INVALID_ARG;
      }
      parsed.value = arg;
      have_value = true;
      continue;
    }

    std::string value;
    if (arg == "-h" || arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (arg == "-v" || arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "-t" || arg == "--type") {
      if (!next_value(&value)) {
        return ESP_ERR_INVALID_ARG;
      }
      const esp_err_t err = barcode::ParseSymbology(value, &parsed.symbology);
      if (err == ESP_ERR_NOT_SUPPORTED) {
        SetError(error, "Barcode type '" + value + "' is not implemented");
        return err;
      }
      if (err != ESP_OK) {
        SetError(error, "Unknown barcode type '" + value + "' (choose codabar, upc or ean)");
        return err;
      }
    } else if (arg == "-d" || arg == "--dpi") {
      if (!next_value(&value)) {
        return ESP_ERR_INVALID_ARG;
      }
      if (!ParseDpi(value, &parsed.dpi)) {
        SetError(error, "DPI must be an integer between " + std::to_string(kMinDpi) + " and " +
                            std::to_string(kMaxDpi) + ": " + value);
        return ESP_ERR_INVALID_ARG;
      }
    } else if (arg == "-f" || arg == "--filename") {
      if (!next_value(&parsed.filename)) {
        return ESP_ERR_INVALID_ARG;
      }
    } else if (arg == "--export-dir") {
      if (!next_value(&parsed.export_dir)) {
        return ESP_ERR_INVALID_ARG;
      }
      if (parsed.export_dir.empty()) {
        SetError(error, "Export directory must not be empty");
        return ESP_ERR_INVALID_ARG;
      }
    } else if (arg == "--text") {
      if (!next_value(&value)) {
        return ESP_ERR_INVALID_ARG;
      }
      parsed.options.text = value;
    } else {
      SetError(error, "Unknown option: " + arg);
      return ESP_ERR_INVALID_ARG;
    }
  }

  if (!have_value && !parsed.show_help && !parsed.show_version) {
    SetError(error, "Missing barcode value");
    return ESP_ERR_INVALID_ARG;
  }

  *config = std::move(parsed);
  return ESP_OK;
}

std::string ResolveOutputPath(const GeneratorConfig& config, const barcode::EncodedBarcode& encoded) {
  if (!config.filename.empty()) {
    return config.filename;
  }

  std::string path = config.export_dir;
  if (!path.empty() && path.back() != '/') {
    path.push_back('/');
  }
  return path + encoded.symbology_name + "-" + encoded.normalized_data + ".png";
}

esp_err_t BuildRenderRequest(const GeneratorConfig& config, const barcode::EncodedBarcode& encoded,
                             std::string* json) {
  if (json == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  cJSON* request = barcode::CreateBarcodeJson(encoded);
  if (request == nullptr) {
    return ESP_ERR_NO_MEM;
  }

  std::vector<uint8_t> modules;
  esp_err_t err = barcode::BarsToModules(encoded.bar_pattern, &modules);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Encoded bar pattern is not drawable: %s", esp_err_to_name(err));
    cJSON_Delete(request);
    return err;
  }
  const std::vector<int> module_values(modules.begin(), modules.end());

  const std::string output = ResolveOutputPath(config, encoded);
  cJSON* modules_json =
      cJSON_CreateIntArray(module_values.data(), static_cast<int>(module_values.size()));
  if (modules_json == nullptr) {
    cJSON_Delete(request);
    return ESP_ERR_NO_MEM;
  }
  cJSON_AddItemToObject(request, "modules", modules_json);

  if (cJSON_AddStringToObject(request, "output", output.c_str()) == nullptr ||
      cJSON_AddNumberToObject(request, "dpi", static_cast<double>(config.dpi)) == nullptr) {
    cJSON_Delete(request);
    return ESP_ERR_NO_MEM;
  }
  return barcode::PrintJsonDocument(request, json);
}

void ConfigureLogging(bool verbose) {
  // stdout is reserved for the render request
  auto stderr_log_hook = [](const char* format, va_list args) -> int {
    return std::vfprintf(stderr, format, args);
  };
  esp_log_set_vprintf(+stderr_log_hook);

  // Quiet runs keep warnings and errors only; -v adds progress messages.
  esp_log_level_set("*", verbose ? ESP_LOG_INFO : ESP_LOG_WARN);
}

esp_err_t RunGenerator(const GeneratorConfig& config, std::string* json) {
  if (json == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  if (config.verbose) {
    ESP_LOGI(kLogTag, "Generating a %s barcode from the value: %s",
             barcode::GetSymbologyName(config.symbology), config.value.c_str());
  }

  barcode::EncodedBarcode encoded;
  esp_err_t err = barcode::EncodeBarcode(config.value, config.symbology, config.options, &encoded);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Failed to encode %s value '%s': %s",
             barcode::GetSymbologyName(config.symbology), config.value.c_str(),
             esp_err_to_name(err));
    return err;
  }

  err = BuildRenderRequest(config, encoded, json);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Failed to build render request: %s", esp_err_to_name(err));
    return err;
  }

  ESP_LOGI(kLogTag, "Prepared barcode: %s", ResolveOutputPath(config, encoded).c_str());
  return ESP_OK;
}

}  // namespace generator
