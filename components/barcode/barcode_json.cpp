#include "barcode/barcode_json.hpp"

#include "esp_log.h"

namespace barcode {

namespace {
constexpr char kLogTag[] = "barcode_json";
}  // namespace

cJSON* CreateBarcodeJson(const EncodedBarcode& encoded) {
  cJSON* root = cJSON_CreateObject();
  if (root == nullptr) {
    return nullptr;
  }

  if (cJSON_AddStringToObject(root, "symbology", encoded.symbology_name.c_str()) == nullptr ||
      cJSON_AddStringToObject(root, "data", encoded.normalized_data.c_str()) == nullptr ||
      cJSON_AddStringToObject(root, "text", encoded.display_text.c_str()) == nullptr ||
      cJSON_AddStringToObject(root, "bars", encoded.bar_pattern.c_str()) == nullptr) {
    cJSON_Delete(root);
    return nullptr;
  }
  return root;
}

esp_err_t PrintJsonDocument(cJSON* document, std::string* json) {
  if (document == nullptr) {
    ESP_LOGE(kLogTag, "Failed to allocate JSON document");
    return ESP_ERR_NO_MEM;
  }
  if (json == nullptr) {
    cJSON_Delete(document);
    return ESP_ERR_INVALID_ARG;
  }

  char* payload = cJSON_PrintUnformatted(document);
  cJSON_Delete(document);
  if (payload == nullptr) {
    ESP_LOGE(kLogTag, "Failed to print JSON document");
    return ESP_ERR_NO_MEM;
  }

  json->assign(payload);
  cJSON_free(payload);
  return ESP_OK;
}

esp_err_t ExportJson(const EncodedBarcode& encoded, std::string* json) {
  if (json == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  return PrintJsonDocument(CreateBarcodeJson(encoded), json);
}

}  // namespace barcode
