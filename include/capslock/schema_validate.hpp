#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "capslock/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace capslock::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * References of the form "capslock:schema/<name>" resolve to
 * "<name>.schema.json" next to the schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] capslock::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path);

}  // namespace capslock::common
