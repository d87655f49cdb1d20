#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, hash, path normalization
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace capslock {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * @brief Error and diagnostic codes shared by every stage
 *
 * Fatal codes abort the run. UnsupportedConstruct and UnresolvedExternalCall
 * are recorded as gaps and surface as UNANALYZED; RuleAmbiguity is a warning.
 */
namespace error_code {

inline constexpr const char* kMalformedInput = "MalformedInput";
inline constexpr const char* kUnsupportedConstruct = "UnsupportedConstruct";
inline constexpr const char* kUnresolvedExternalCall = "UnresolvedExternalCall";
inline constexpr const char* kRuleAmbiguity = "RuleAmbiguity";
inline constexpr const char* kConfigurationError = "ConfigurationError";
inline constexpr const char* kBudgetExceeded = "BudgetExceeded";
inline constexpr const char* kIoError = "IOError";
inline constexpr const char* kDuplicateDefinition = "DuplicateDefinition";
inline constexpr const char* kNoEntryPoints = "NoEntryPoints";
inline constexpr const char* kInternalError = "InternalError";

}  // namespace error_code

}  // namespace capslock

namespace capslock::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 *
 * @param input Input path
 * @return Normalized path ("." for empty input)
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Join a debug-info directory and file name into one normalized path.
 * An absolute file name ignores the directory.
 */
[[nodiscard]] std::string join_source_path(std::string_view directory, std::string_view filename);

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

}  // namespace capslock::common
