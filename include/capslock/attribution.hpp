#pragma once

/**
 * @file attribution.hpp
 * @brief Per-unit capability aggregation and evidence paths
 */

#include "capslock/budget.hpp"
#include "capslock/callgraph.hpp"
#include "capslock/capability.hpp"
#include "capslock/matcher.hpp"
#include "capslock/propagation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace capslock::attribution {

/**
 * @brief One function on an evidence path
 *
 * call_site is the site in this function that leads to the next step. On the
 * last step it is the gap site for gap-derived UNANALYZED findings, else empty.
 */
struct PathStep
{
    std::string symbol;
    std::string call_site;
    std::optional<ir::Location> src;
};

struct CapabilityFinding
{
    Capability capability = Capability::kUnanalyzed;
    std::string entry;                ///< Symbol of steps.front()
    std::vector<PathStep> steps;      ///< Entry first, triggering function last
    std::vector<callgraph::FunctionId> path;  ///< Same walk as FunctionIds
    matcher::EvidenceKind origin = matcher::EvidenceKind::kRule;
    std::string origin_detail;        ///< Rule pattern or gap description
};

struct LibraryUnit
{
    std::string name;
    std::vector<callgraph::FunctionId> functions;  ///< Ascending FunctionId
    std::vector<callgraph::FunctionId> entries;    ///< Sorted by symbol
    CapabilitySet capabilities;
    std::vector<CapabilityFinding> findings;       ///< Taxonomy order
};

struct Attribution
{
    std::vector<LibraryUnit> units;  ///< Sorted by name
};

struct AttributionOptions
{
    unsigned jobs = 1;  ///< Units are attributed concurrently
};

/**
 * Group functions into units and reconstruct one shortest path per
 * (unit, capability).
 *
 * Only units owning at least one function with a body are reported.
 * Ties between equally short paths go to the lexicographically smallest
 * entry symbol, then to call-site declaration order.
 */
[[nodiscard]] capslock::Result<Attribution> attribute(const callgraph::CallGraph& graph,
                                                      const matcher::Classification& intrinsics,
                                                      const propagation::Propagation& propagation,
                                                      const AttributionOptions& options,
                                                      BudgetTracker* budget);

/// True if path is a walk along graph edges from an entry of unit to a function holding capability.
[[nodiscard]] bool is_valid_evidence(const callgraph::CallGraph& graph,
                                     const matcher::Classification& intrinsics,
                                     const LibraryUnit& unit,
                                     const CapabilityFinding& finding);

}  // namespace capslock::attribution
