#pragma once

/**
 * @file barcode_json.hpp
 * @brief JSON form of EncodedBarcode for the renderer collaborator
 *
 * Document layout:
 * @code
 * {"symbology":"codabar","data":"A0A","text":"0","bars":"1011001001010101001101011001001"}
 * @endcode
 */

#include <string>

extern "C" {
#include "cJSON.h"
#include "esp_err.h"
}

#include "barcode/barcode.hpp"

namespace barcode {

/**
 * @brief Build a cJSON object for an encoded barcode
 *
 * @return New object the caller must release with cJSON_Delete(),
 *         or nullptr on allocation failure
 */
cJSON* CreateBarcodeJson(const EncodedBarcode& encoded);

/**
 * @brief Render a cJSON document without whitespace and release it
 *
 * Takes ownership of document in every case.
 *
 * @return ESP_OK, ESP_ERR_NO_MEM if document is null or printing fails,
 *         ESP_ERR_INVALID_ARG if json is null
 */
esp_err_t PrintJsonDocument(cJSON* document, std::string* json);

/**
 * @brief Serialize an encoded barcode to compact JSON
 *
 * @return ESP_OK, ESP_ERR_NO_MEM on allocation failure, ESP_ERR_INVALID_ARG if json is null
 */
esp_err_t ExportJson(const EncodedBarcode& encoded, std::string* json);

}  // namespace barcode
