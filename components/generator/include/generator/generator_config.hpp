#pragma once

/**
 * @file generator_config.hpp
 * @brief Command-line configuration of the barcode generator
 *
 * CONFIGURATION STRUCTURE:
 * ========================
 * GeneratorConfig
 *  ├─ value: Raw data to encode (positional, required)
 *  ├─ symbology: -t/--type codabar|upc (ean is recognized, not implemented)
 *  ├─ dpi: -d/--dpi, 1-2400 dots per inch for the renderer
 *  ├─ filename: -f/--filename, explicit output image path
 *  ├─ export_dir: --export-dir, directory of derived filenames
 *  ├─ options.text: --text, caption override
 *  └─ verbose: -v/--verbose
 *
 * The generator does not rasterize or write files. It produces a render
 * request (bar pattern, caption, output path, dpi) for an external renderer.
 *
 * USAGE EXAMPLE:
 * ==============
 * @code
 * generator::GeneratorConfig cfg;
 * std::string error;
 * if (generator::ParseArguments({"1234", "--type", "codabar"}, &cfg, &error) != ESP_OK) {
 *   // error holds a one-line message
 * }
 * std::string request;
 * generator::RunGenerator(cfg, &request);
 * // {"symbology":"codabar","data":"A1234A","text":"1234","bars":"...",
 * //  "modules":[1,0,1,...],"output":"export/codabar-A1234A.png","dpi":100}
 * @endcode
 */

#include <cstdint>
#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

#include "barcode/barcode.hpp"

namespace generator {

/// Smallest accepted --dpi value.
constexpr uint32_t kMinDpi = 1;

/// Largest accepted --dpi value.
constexpr uint32_t kMaxDpi = 2400;

/// Help text printed for -h/--help and usage errors.
constexpr const char* kUsage =
    "Usage: barcode_generator <value> [-t codabar|upc|ean] [-d dpi] [-f filename]\n"
    "                         [--text caption] [--export-dir dir] [-v] [--version]\n"
    "       barcode_generator [options] -- <value>   (value starting with '-')";

struct GeneratorConfig {
  std::string value;
  barcode::Symbology symbology = barcode::Symbology::kCodabar;
  uint32_t dpi = 100;
  std::string filename;
  std::string export_dir = "export";
  barcode::BarcodeOptions options;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Parse command-line arguments (program name excluded)
 *
 * @param args Arguments in order, e.g. {"1234", "-t", "upc"}
 * @param[out] config Updated in place; fields not named on the command line keep
 *             their current values
 * @param[out] error One-line message on failure (may be null)
 * @return ESP_OK on success
 *         ESP_ERR_INVALID_ARG for unknown flags, missing values, out-of-range
 *         numbers, unknown types or a missing/duplicate value
 *         ESP_ERR_NOT_SUPPORTED for a recognized type with no encoder ("ean")
 *
 * "-h"/"--help" and "--version" skip the missing-value check. An argument of
 * '-' followed by a digit ("-12") is data. "--" ends option parsing, so any
 * data starting with '-' ("-$") can follow it.
 */
esp_err_t ParseArguments(const std::vector<std::string>& args, GeneratorConfig* config,
                         std::string* error);

/**
 * @brief Output image path for an encoded barcode
 *
 * config.filename if set, otherwise "{export_dir}/{symbology}-{data}.png".
 */
std::string ResolveOutputPath(const GeneratorConfig& config, const barcode::EncodedBarcode& encoded);

/**
 * @brief Render request JSON: the barcode record plus "modules", "output" and "dpi"
 *
 * "modules" is the bar pattern as a 0/1 integer array, one entry per module.
 *
 * @return ESP_OK, ESP_ERR_NO_MEM on allocation failure, ESP_ERR_INVALID_ARG if json
 *         is null or the bar pattern is empty or not made of '0'/'1'
 */
esp_err_t BuildRenderRequest(const GeneratorConfig& config, const barcode::EncodedBarcode& encoded,
                             std::string* json);

/**
 * @brief Send ESP-IDF log output to stderr and set the global log level
 *
 * verbose selects ESP_LOG_INFO, otherwise ESP_LOG_WARN.
 */
void ConfigureLogging(bool verbose);

/**
 * @brief Encode config.value and build its render request
 *
 * @param[out] json Render request on success
 * @return ESP_OK or the first failing stage's code (see barcode::EncodeBarcode)
 */
esp_err_t RunGenerator(const GeneratorConfig& config, std::string* json);

}  // namespace generator
