#pragma once

/**
 * @file version.hpp
 * @brief capslock version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace capslock {

/// capslock version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document schema versions (embedded in all inputs and outputs)
constexpr const char* kIrSchemaVersion = "cir.v1";
constexpr const char* kRulesSchemaVersion = "caps_rules.v1";
constexpr const char* kReportSchemaVersion = "caps_report.v1";
constexpr const char* kConfigSchemaVersion = "caps_config.v1";

}  // namespace capslock
