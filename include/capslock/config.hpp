#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration and caps_config.v1 loading
 */

#include "capslock/budget.hpp"
#include "capslock/callgraph.hpp"
#include "capslock/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace capslock {

struct EngineConfig
{
    std::filesystem::path schema_dir;  ///< Empty disables JSON Schema validation
    unsigned jobs = 1;                 ///< 0 = hardware concurrency
    callgraph::IndirectPolicy indirect_policy = callgraph::IndirectPolicy::kSignature;
    bool strict = false;               ///< UnsupportedConstruct fails loading
    bool include_edges = false;        ///< Emit the call edge list in the report
    AnalysisBudget budget;
    std::optional<std::string> log_level;  ///< Same syntax as --log-level
};

[[nodiscard]] capslock::Result<callgraph::IndirectPolicy> parse_indirect_policy(std::string_view text);
[[nodiscard]] std::string_view to_string(callgraph::IndirectPolicy policy);

/**
 * Apply a caps_config.v1 document on top of base.
 * Keys absent from the document keep the base value.
 * @return Merged configuration or ConfigurationError
 */
[[nodiscard]] capslock::Result<EngineConfig> apply_config(const nlohmann::json& doc, EngineConfig base);

/// Read, validate (when base.schema_dir is set) and apply a config file.
[[nodiscard]] capslock::Result<EngineConfig> load_config(const std::filesystem::path& path,
                                                         EngineConfig base);

}  // namespace capslock
