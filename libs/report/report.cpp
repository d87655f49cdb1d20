/**
 * @file report.cpp
 * @brief caps_report.v1 document assembly
 */

#include "capslock/report.hpp"

#include "capslock/canonical_json.hpp"
#include "capslock/version.hpp"

#include <algorithm>
#include <tuple>

namespace capslock::report {

namespace {

[[nodiscard]] nlohmann::json location_json(const std::optional<ir::Location>& src)
{
    if (!src.has_value()) {
        return nullptr;
    }
    nlohmann::json out;
    ir::to_json(out, *src);
    return out;
}

[[nodiscard]] nlohmann::json finding_json(const attribution::CapabilityFinding& finding)
{
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : finding.steps) {
        nlohmann::json item = {
            {"symbol", step.symbol}
        };
        if (!step.call_site.empty()) {
            item["call_site"] = step.call_site;
        }
        if (step.src.has_value()) {
            item["src"] = location_json(step.src);
        }
        steps.push_back(std::move(item));
    }
    return nlohmann::json{
        {"capability", std::string(to_string(finding.capability))},
        {    "origin", std::string(matcher::to_string(finding.origin))},
        {    "detail",                               finding.origin_detail},
        {      "path",                               std::move(steps)}
    };
}

[[nodiscard]] nlohmann::json units_json(const Analysis& analysis)
{
    nlohmann::json units = nlohmann::json::array();
    for (const auto& unit : analysis.attribution.units) {
        nlohmann::json entries = nlohmann::json::array();
        for (callgraph::FunctionId id : unit.entries) {
            entries.push_back(analysis.graph.node(id).symbol);
        }
        nlohmann::json capabilities = nlohmann::json::array();
        for (const auto& finding : unit.findings) {
            capabilities.push_back(finding_json(finding));
        }
        units.push_back(nlohmann::json{
            {        "name",                    unit.name},
            {"entry_points",          std::move(entries)},
            {   "functions",        unit.functions.size()},
            {"capabilities",     std::move(capabilities)}
        });
    }
    return units;
}

[[nodiscard]] nlohmann::json functions_json(const Analysis& analysis)
{
    std::vector<callgraph::FunctionId> ids;
    for (callgraph::FunctionId id = 0; id < analysis.graph.size(); ++id) {
        if (!analysis.propagation.reachable[id].empty()) {
            ids.push_back(id);
        }
    }
    std::ranges::sort(ids, [&analysis](callgraph::FunctionId lhs, callgraph::FunctionId rhs) {
        return analysis.graph.node(lhs).symbol < analysis.graph.node(rhs).symbol;
    });

    nlohmann::json functions = nlohmann::json::array();
    for (callgraph::FunctionId id : ids) {
        const callgraph::FunctionNode& node = analysis.graph.node(id);
        nlohmann::json capabilities = nlohmann::json::object();
        for (Capability capability : analysis.propagation.reachable[id].to_vector()) {
            capabilities[std::string(to_string(capability))] =
                std::string(to_string(analysis.type_of(id, capability)));
        }
        nlohmann::json item = {
            {      "symbol",                node.symbol},
            {"display_name",          node.display_name},
            {        "unit",                  node.unit},
            {    "external",              node.external},
            {       "entry",                 node.entry},
            {"capabilities",    std::move(capabilities)}
        };
        if (node.src.has_value()) {
            item["src"] = location_json(node.src);
        }
        functions.push_back(std::move(item));
    }
    return functions;
}

[[nodiscard]] nlohmann::json edges_json(const Analysis& analysis)
{
    using EdgeKey = std::tuple<std::string, std::string, std::string>;
    std::vector<EdgeKey> edges;
    for (callgraph::FunctionId id = 0; id < analysis.graph.size(); ++id) {
        for (const callgraph::Edge& edge : analysis.graph.edges(id)) {
            edges.emplace_back(analysis.graph.node(id).symbol,
                               analysis.graph.node(edge.callee).symbol,
                               analysis.graph.site(edge.site).id);
        }
    }
    std::ranges::sort(edges);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [caller, callee, site] : edges) {
        out.push_back(nlohmann::json{
            {   "caller", caller},
            {   "callee", callee},
            {"call_site",   site}
        });
    }
    return out;
}

[[nodiscard]] nlohmann::json diagnostic_json(const Diagnostic& diagnostic)
{
    nlohmann::json out = {
        {    "code",                        diagnostic.code},
        {"severity", std::string(to_string(diagnostic.severity))},
        {  "detail",                      diagnostic.detail}
    };
    if (!diagnostic.symbol.empty()) {
        out["symbol"] = diagnostic.symbol;
    }
    if (!diagnostic.unit.empty()) {
        out["unit"] = diagnostic.unit;
    }
    if (!diagnostic.site_id.empty()) {
        out["site_id"] = diagnostic.site_id;
    }
    if (diagnostic.src.has_value()) {
        out["src"] = location_json(diagnostic.src);
    }
    return out;
}

[[nodiscard]] std::string join(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

}  // namespace

std::string_view to_string(Severity severity)
{
    switch (severity) {
        case Severity::kWarning:
            return "warning";
        case Severity::kUnanalyzed:
            return "unanalyzed";
    }
    return "warning";
}

std::vector<Diagnostic> collect_diagnostics(const Analysis& analysis)
{
    std::vector<Diagnostic> diagnostics;
    const auto& graph = analysis.graph;

    for (const auto& ambiguity : analysis.classification.ambiguities) {
        const auto id = graph.find(ambiguity.symbol);
        diagnostics.push_back(Diagnostic{
            .code = error_code::kRuleAmbiguity,
            .severity = Severity::kWarning,
            .symbol = ambiguity.symbol,
            .unit = id ? graph.node(*id).unit : std::string{},
            .site_id = {},
            .detail = "rule '" + ambiguity.chosen_pattern + "' chosen over " + join(ambiguity.tied_patterns),
            .src = {}});
    }
    for (const auto& node : graph.nodes()) {
        for (const ir::Gap& gap : node.gaps) {
            diagnostics.push_back(Diagnostic{.code = gap.code,
                                             .severity = Severity::kUnanalyzed,
                                             .symbol = node.symbol,
                                             .unit = node.unit,
                                             .site_id = gap.site_id,
                                             .detail = gap.detail,
                                             .src = gap.src});
        }
    }
    for (const auto& duplicate : graph.duplicates()) {
        diagnostics.push_back(Diagnostic{.code = error_code::kDuplicateDefinition,
                                         .severity = Severity::kWarning,
                                         .symbol = duplicate.symbol,
                                         .unit = {},
                                         .site_id = {},
                                         .detail = "kept definition from " + duplicate.kept_module
                                                   + ", merged calls from " + duplicate.dropped_module,
                                         .src = {}});
    }
    for (const auto& unit : analysis.attribution.units) {
        if (!unit.entries.empty()) {
            continue;
        }
        diagnostics.push_back(Diagnostic{.code = error_code::kNoEntryPoints,
                                         .severity = Severity::kWarning,
                                         .symbol = {},
                                         .unit = unit.name,
                                         .site_id = {},
                                         .detail = "unit declares no entry points; no capabilities attributed",
                                         .src = {}});
    }

    std::ranges::sort(diagnostics, [](const Diagnostic& lhs, const Diagnostic& rhs) {
        return std::tie(lhs.code, lhs.symbol, lhs.unit, lhs.site_id, lhs.detail)
               < std::tie(rhs.code, rhs.symbol, rhs.unit, rhs.site_id, rhs.detail);
    });
    return diagnostics;
}

capslock::Result<nlohmann::json>
build_report(const Analysis& analysis, const rules::RuleTable& table, const ReportOptions& options)
{
    nlohmann::json modules = nlohmann::json::array();
    for (const auto& module : analysis.modules) {
        modules.push_back(nlohmann::json{
            {   "module_id",    module.module_id},
            {        "unit",         module.unit},
            {"input_digest", module.input_digest}
        });
    }

    nlohmann::json diagnostics = nlohmann::json::array();
    std::size_t unanalyzed = 0;
    for (const auto& diagnostic : collect_diagnostics(analysis)) {
        if (diagnostic.severity == Severity::kUnanalyzed) {
            ++unanalyzed;
        }
        diagnostics.push_back(diagnostic_json(diagnostic));
    }

    nlohmann::json report = {
        {"schema_version",                                                     kReportSchemaVersion},
        {          "tool", {{"name", "capslock"}, {"version", kVersion}, {"build_id", kBuildId}}},
        { "rules_version",                                                          table.version()},
        {  "rules_digest",                                                           table.digest()},
        {  "input_digest",                                                   analysis.input_digest},
        {       "modules",                                                       std::move(modules)},
        {         "units",                                                    units_json(analysis)},
        {     "functions",                                                functions_json(analysis)},
        {   "diagnostics",                                                   std::move(diagnostics)},
        {       "summary",
         {{"functions", analysis.graph.size()},
         {"call_sites", analysis.graph.sites().size()},
         {"units", analysis.attribution.units.size()},
         {"unanalyzed_sites", unanalyzed}}                                                          },
        {      "complete",                                                                    true}
    };
    if (options.include_edges) {
        report["edges"] = edges_json(analysis);
    }

    if (auto valid = canonical::validate_for_canonical(report); !valid) {
        return std::unexpected(valid.error());
    }
    return report;
}

}  // namespace capslock::report
