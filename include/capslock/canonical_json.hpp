#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic output
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point)
 */

#include "capslock/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace capslock::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] capslock::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] capslock::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements (no floating point numbers)
 */
[[nodiscard]] capslock::VoidResult validate_for_canonical(const nlohmann::json& j);

/**
 * Write canonical JSON followed by a newline, creating parent directories.
 */
[[nodiscard]] capslock::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                             const nlohmann::json& j);

}  // namespace capslock::canonical
