#pragma once

/**
 * @file report.hpp
 * @brief caps_report.v1 output and run diagnostics
 */

#include "capslock/common.hpp"
#include "capslock/engine.hpp"
#include "capslock/rules.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace capslock::report {

enum class Severity {
    kWarning,     ///< Presentation-only issue, results are unaffected
    kUnanalyzed,  ///< Surfaced as UNANALYZED on the named function
};

[[nodiscard]] std::string_view to_string(Severity severity);

struct Diagnostic
{
    std::string code;  ///< error_code constant
    Severity severity = Severity::kWarning;
    std::string symbol;
    std::string unit;
    std::string site_id;
    std::string detail;
    std::optional<ir::Location> src;
};

/**
 * Gather every non-fatal diagnostic of a run: rule ambiguities, gaps,
 * duplicate definitions and units without entry points.
 * Sorted by (code, symbol, unit, site_id, detail).
 */
[[nodiscard]] std::vector<Diagnostic> collect_diagnostics(const Analysis& analysis);

struct ReportOptions
{
    bool include_edges = false;
};

/**
 * Build the caps_report.v1 document for a completed run.
 * Every array is sorted, so canonical serialization is byte-stable.
 */
[[nodiscard]] capslock::Result<nlohmann::json> build_report(const Analysis& analysis,
                                                            const rules::RuleTable& table,
                                                            const ReportOptions& options);

}  // namespace capslock::report
