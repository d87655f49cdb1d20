#pragma once

/**
 * @file logging.hpp
 * @brief spdlog-based logging with one logger per pipeline stage
 *
 * Logs go to stderr (and optionally a file), never into reports.
 */

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace capslock {

//=============================================================================
// Log Level Guidelines
//=============================================================================
// TRACE - Per-function and per-call-site detail
// DEBUG - Stage statistics, intermediate state
// INFO  - Stage progress
// WARN  - Gaps, rule ambiguities, duplicate definitions
// ERROR - Fatal diagnostics before the run aborts
//=============================================================================

enum class LogCategory : std::size_t {
    kCore,         // Engine facade and CLI (capslock.core)
    kLoader,       // IR loading and frontends
    kGraph,        // Call graph construction
    kRules,        // Rule tables and matching
    kPropagate,    // Propagation engine
    kAttribution,  // Units and evidence paths
    kCount         // Sentinel for array sizing
};

inline constexpr std::size_t kLogCategoryCount = static_cast<std::size_t>(LogCategory::kCount);

[[nodiscard]] std::string_view category_name(LogCategory category);

/// Environment variable consulted when no CLI level is given
inline constexpr const char* kLogEnvVar = "CAPSLOCK_LOG";

struct LogConfig
{
    std::string log_file;
    spdlog::level::level_enum default_level = spdlog::level::warn;
    bool log_to_console = true;

    /// Per-category levels (nullopt = use default_level)
    std::array<std::optional<spdlog::level::level_enum>, kLogCategoryCount> category_levels{};
};

/// Initialize logging; a second call only updates levels.
void init_logging(const LogConfig& config);

/// Flush and drop all loggers.
void shutdown_logging();

/// Logger for a category; initializes with defaults on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> get_logger(LogCategory category);

void set_all_levels(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

[[nodiscard]] std::optional<LogCategory> category_from_name(std::string_view name);

/**
 * Apply a filter string: a bare level ("debug") sets the default level,
 * "graph=trace,rules=debug" sets category levels. Unknown entries are ignored.
 */
void apply_log_filter(LogConfig& config, std::string_view filter);

/**
 * Build a LogConfig.
 * Precedence: CLI level > CAPSLOCK_LOG environment variable > warn.
 */
[[nodiscard]] LogConfig build_log_config(std::string_view cli_level, std::string log_file = {});

}  // namespace capslock

// Use spdlog::logger::log() directly so SPDLOG_ACTIVE_LEVEL does not strip calls.
#define CAPSLOCK_LOG_IMPL(cat, lvl, ...)                                                      \
    do {                                                                                      \
        if (auto capslock_logger_ = ::capslock::get_logger(::capslock::LogCategory::cat)) {   \
            capslock_logger_->log(spdlog::source_loc{__FILE__, __LINE__, __FUNCTION__}, lvl, \
                                  __VA_ARGS__);                                               \
        }                                                                                     \
    } while (0)

#define CAPSLOCK_LOG_TRACE(cat, ...) CAPSLOCK_LOG_IMPL(cat, spdlog::level::trace, __VA_ARGS__)
#define CAPSLOCK_LOG_DEBUG(cat, ...) CAPSLOCK_LOG_IMPL(cat, spdlog::level::debug, __VA_ARGS__)
#define CAPSLOCK_LOG_INFO(cat, ...) CAPSLOCK_LOG_IMPL(cat, spdlog::level::info, __VA_ARGS__)
#define CAPSLOCK_LOG_WARN(cat, ...) CAPSLOCK_LOG_IMPL(cat, spdlog::level::warn, __VA_ARGS__)
#define CAPSLOCK_LOG_ERROR(cat, ...) CAPSLOCK_LOG_IMPL(cat, spdlog::level::err, __VA_ARGS__)
