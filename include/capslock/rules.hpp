#pragma once

/**
 * @file rules.hpp
 * @brief Capability rule tables and symbol matching
 *
 * A RuleTable is immutable after load and shared read-only by every stage.
 */

#include "capslock/capability.hpp"
#include "capslock/common.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace capslock::rules {

/**
 * Pattern kinds in decreasing specificity.
 */
enum class PatternKind {
    kExact,     ///< "std::fs::File::open"
    kPrefix,    ///< "std::fs::*" or "open*"; longer prefixes are more specific
    kCatchAll,  ///< "*": any externally-defined function no other rule covers
};

[[nodiscard]] std::string_view to_string(PatternKind kind);

struct CapabilityRule
{
    std::string pattern;        ///< As written in the table
    PatternKind kind = PatternKind::kExact;
    std::string stem;           ///< Exact name or prefix without the trailing '*'
    CapabilitySet capabilities; ///< Empty for SAFE rules
    std::size_t index = 0;      ///< Declaration order
};

struct RuleMatch
{
    const CapabilityRule* rule = nullptr;      ///< Winner (first declared)
    std::vector<const CapabilityRule*> tied;   ///< Other rules at equal specificity
};

class RuleTable
{
public:
    RuleTable() = default;
    RuleTable(std::string version, std::vector<CapabilityRule> rules);

    /**
     * Build from a caps_rules.v1 document.
     * @param schema_dir Directory with caps_rules.v1.schema.json; empty skips validation
     * @return Table or ConfigurationError
     */
    [[nodiscard]] static capslock::Result<RuleTable>
    from_json(const nlohmann::json& doc, const std::filesystem::path& schema_dir);

    /**
     * Build from capability-map text: "# comment" lines, blank lines, and
     * "<pattern> <CAP> [<CAP>...]" records.
     */
    [[nodiscard]] static capslock::Result<RuleTable> from_capability_map(std::string_view text,
                                                                         std::string_view source);

    /// Load a ".cm" capability map or a caps_rules.v1 JSON file.
    [[nodiscard]] static capslock::Result<RuleTable> load(const std::filesystem::path& path,
                                                          const std::filesystem::path& schema_dir);

    /**
     * Find the most specific rule for a function.
     * Exact and prefix patterns are tried against the symbol and the display
     * name; catch-all rules only apply when is_external is set.
     */
    [[nodiscard]] std::optional<RuleMatch>
    match(std::string_view symbol, std::string_view display_name, bool is_external) const;

    [[nodiscard]] const std::string& version() const { return m_version; }
    [[nodiscard]] const std::vector<CapabilityRule>& rules() const { return m_rules; }

    /// "sha256:" digest of the canonical rule list
    [[nodiscard]] const std::string& digest() const { return m_digest; }

private:
    std::string m_version;
    std::vector<CapabilityRule> m_rules;
    std::string m_digest;
    std::unordered_map<std::string, std::vector<std::size_t>> m_exact;
    std::vector<std::size_t> m_prefix;  ///< Longest prefix first, then declaration order
    std::vector<std::size_t> m_catch_all;
};

/// Classify a pattern string; ConfigurationError for misplaced wildcards.
[[nodiscard]] capslock::Result<CapabilityRule> make_rule(std::string pattern,
                                                         const std::vector<std::string>& capabilities,
                                                         std::size_t index);

}  // namespace capslock::rules
