// main.cpp - host entry point for the barcode generator.
//
// Responsibilities of main():
// 1. Parse command-line arguments into a GeneratorConfig, route logs to stderr
// 2. Encode the value and build the render request
// 3. Print the render request (JSON) on stdout for the renderer
//
// Encoding, captions and output path derivation live in components/barcode and
// components/generator. Exit status is 0 on success and 1 on any failure.

#include <cstdio>
#include <string>
#include <vector>

#include "esp_log.h"

#include "generator/generator_config.hpp"
#include "generator/version.hpp"

namespace {
constexpr char kLogTag[] = "main";  // Logging tag for the entry point.
}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  generator::ConfigureLogging(false);

  generator::GeneratorConfig config;
  std::string error;
  esp_err_t err = generator::ParseArguments(args, &config, &error);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "%s", error.c_str());
    std::fprintf(stderr, "%s\n", generator::kUsage);
    return 1;
  }
  generator::ConfigureLogging(config.verbose);

  if (config.show_help) {
    std::printf("%s\n", generator::kUsage);
    return 0;
  }
  if (config.show_version) {
    std::printf("%s\n", generator::kFullVersionString);
    return 0;
  }

  std::string request;
  err = generator::RunGenerator(config, &request);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Barcode generation failed: %s", esp_err_to_name(err));
    return 1;
  }

  std::printf("%s\n", request.c_str());
  return 0;
}
