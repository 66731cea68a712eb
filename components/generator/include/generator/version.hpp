#pragma once

/**
 * @file version.hpp
 * @brief Generator version information
 *
 * VERSION FORMAT: MAJOR.MINOR.PATCH[-SUFFIX]
 * - MAJOR: Incremented for breaking changes to the render request or CLI
 * - MINOR: Incremented for new symbologies or options
 * - PATCH: Incremented for bug fixes
 */

namespace generator {

/**
 * @brief Generator version string (semantic versioning format)
 *
 * - 1.0.0: Codabar encoding, UPC validation, JSON render request
 */
constexpr const char* kVersion = "1.0.0";

/**
 * @brief Project name
 */
constexpr const char* kProjectName = "Barcode Generator";

/**
 * @brief Full version string for display
 *
 * Example: "Barcode Generator v1.0.0"
 */
constexpr const char* kFullVersionString = "Barcode Generator v1.0.0";

}  // namespace generator
