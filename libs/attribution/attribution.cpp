/**
 * @file attribution.cpp
 * @brief Unit grouping and breadth-first evidence path reconstruction
 */

#include "capslock/attribution.hpp"

#include "capslock/logging.hpp"
#include "capslock/parallel.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <vector>

#include <fmt/format.h>

namespace capslock::attribution {

namespace {

struct Visit
{
    callgraph::FunctionId parent = callgraph::kInvalidFunction;
    callgraph::SiteId site = 0;
    bool seen = false;
};

struct BestPath
{
    std::vector<callgraph::FunctionId> path;
    std::vector<callgraph::SiteId> sites;  ///< sites[i] leads from path[i] to path[i + 1]
};

using BestByCapability = std::array<std::optional<BestPath>, kCapabilityCount>;

[[nodiscard]] BestPath unwind(const std::vector<Visit>& visits, callgraph::FunctionId target)
{
    BestPath best;
    for (callgraph::FunctionId node = target; node != callgraph::kInvalidFunction;) {
        const Visit& visit = visits[node];
        best.path.push_back(node);
        if (visit.parent != callgraph::kInvalidFunction) {
            best.sites.push_back(visit.site);
        }
        node = visit.parent;
    }
    std::ranges::reverse(best.path);
    std::ranges::reverse(best.sites);
    return best;
}

/**
 * One breadth-first search seeded with every entry in symbol order.
 *
 * Each level of the queue stays ordered by the entry it descends from, so
 * the first function found holding a capability lies on a fewest-hops path
 * from the smallest entry reaching it at that depth; edges are expanded in
 * call-site order.
 */
[[nodiscard]] BestByCapability search_from_entries(const callgraph::CallGraph& graph,
                                                   const matcher::Classification& intrinsics,
                                                   const std::vector<callgraph::FunctionId>& entries,
                                                   CapabilitySet pending)
{
    BestByCapability best;
    std::vector<Visit> visits(graph.size());
    std::vector<callgraph::FunctionId> queue;
    for (callgraph::FunctionId entry : entries) {
        visits[entry].seen = true;
        queue.push_back(entry);
    }

    for (std::size_t head = 0; head < queue.size() && !pending.empty(); ++head) {
        const callgraph::FunctionId node = queue[head];
        for (Capability capability : pending.to_vector()) {
            if (intrinsics.functions[node].capabilities.contains(capability)) {
                best[static_cast<std::size_t>(capability)] = unwind(visits, node);
                pending.erase(capability);
            }
        }

        for (const callgraph::Edge& edge : graph.edges(node)) {
            Visit& visit = visits[edge.callee];
            if (visit.seen) {
                continue;
            }
            visit = Visit{.parent = node, .site = edge.site, .seen = true};
            queue.push_back(edge.callee);
        }
    }
    return best;
}

[[nodiscard]] const matcher::IntrinsicTag* find_tag(const matcher::FunctionIntrinsics& intrinsics,
                                                    Capability capability)
{
    auto it = std::ranges::find(intrinsics.tags, capability, &matcher::IntrinsicTag::capability);
    return it == intrinsics.tags.end() ? nullptr : &*it;
}

[[nodiscard]] CapabilityFinding make_finding(const callgraph::CallGraph& graph,
                                             const matcher::Classification& intrinsics,
                                             Capability capability,
                                             BestPath best)
{
    CapabilityFinding finding;
    finding.capability = capability;
    for (std::size_t i = 0; i < best.path.size(); ++i) {
        const callgraph::FunctionNode& node = graph.node(best.path[i]);
        PathStep step{.symbol = node.symbol, .call_site = {}, .src = node.src};
        if (i < best.sites.size()) {
            const callgraph::CallSite& site = graph.site(best.sites[i]);
            step.call_site = site.id;
            step.src = site.src;
        }
        finding.steps.push_back(std::move(step));
    }

    if (const auto* tag = find_tag(intrinsics.functions[best.path.back()], capability)) {
        finding.origin = tag->kind;
        finding.origin_detail = tag->detail;
        if (!tag->site_id.empty()) {
            PathStep& last = finding.steps.back();
            last.call_site = tag->site_id;
            const auto& gaps = graph.node(best.path.back()).gaps;
            auto gap = std::ranges::find(gaps, tag->site_id, &ir::Gap::site_id);
            if (gap != gaps.end() && gap->src.has_value()) {
                last.src = gap->src;
            }
        }
    }
    finding.entry = finding.steps.front().symbol;
    finding.path = std::move(best.path);
    return finding;
}

capslock::VoidResult attribute_unit(const callgraph::CallGraph& graph,
                                    const matcher::Classification& intrinsics,
                                    const propagation::Propagation& propagation,
                                    LibraryUnit& unit)
{
    for (callgraph::FunctionId entry : unit.entries) {
        unit.capabilities.merge(propagation.reachable[entry]);
    }

    BestByCapability best = search_from_entries(graph, intrinsics, unit.entries, unit.capabilities);

    for (Capability capability : unit.capabilities.to_vector()) {
        auto& found = best[static_cast<std::size_t>(capability)];
        if (!found.has_value()) {
            return std::unexpected(Error::make(
                error_code::kInternalError,
                fmt::format("no evidence path for {} in unit {}", to_string(capability), unit.name)));
        }
        unit.findings.push_back(make_finding(graph, intrinsics, capability, std::move(*found)));
    }
    return {};
}

}  // namespace

capslock::Result<Attribution> attribute(const callgraph::CallGraph& graph,
                                        const matcher::Classification& intrinsics,
                                        const propagation::Propagation& propagation,
                                        const AttributionOptions& options,
                                        BudgetTracker* budget)
{
    std::map<std::string, LibraryUnit> by_name;
    for (callgraph::FunctionId id = 0; id < graph.size(); ++id) {
        const callgraph::FunctionNode& node = graph.node(id);
        LibraryUnit& unit = by_name[node.unit];
        unit.functions.push_back(id);
        if (node.entry) {
            unit.entries.push_back(id);
        }
    }

    Attribution result;
    for (auto& [name, unit] : by_name) {
        const bool has_body = std::ranges::any_of(unit.functions, [&graph](callgraph::FunctionId id) {
            return !graph.node(id).external;
        });
        if (!has_body) {
            continue;
        }
        unit.name = name;
        std::ranges::sort(unit.entries, [&graph](callgraph::FunctionId lhs, callgraph::FunctionId rhs) {
            return graph.node(lhs).symbol < graph.node(rhs).symbol;
        });
        if (unit.entries.empty()) {
            CAPSLOCK_LOG_WARN(kAttribution, "unit {} has no entry points", name);
        }
        result.units.push_back(std::move(unit));
    }

    if (budget != nullptr && !budget->check_time()) {
        return std::unexpected(budget->exceeded_error("attribution"));
    }

    std::vector<capslock::VoidResult> outcomes(result.units.size());
    const auto work = [&](std::size_t i) {
        outcomes[i] = attribute_unit(graph, intrinsics, propagation, result.units[i]);
    };
    if (auto ran = parallel::run_batch(result.units.size(), callgraph::effective_jobs(options.jobs), work);
        !ran) {
        return std::unexpected(ran.error());
    }
    for (const auto& outcome : outcomes) {
        if (!outcome) {
            return std::unexpected(outcome.error());
        }
    }

    CAPSLOCK_LOG_INFO(kAttribution, "attributed {} units", result.units.size());
    return result;
}

bool is_valid_evidence(const callgraph::CallGraph& graph,
                       const matcher::Classification& intrinsics,
                       const LibraryUnit& unit,
                       const CapabilityFinding& finding)
{
    if (finding.path.empty() || finding.path.size() != finding.steps.size()) {
        return false;
    }
    if (std::ranges::find(unit.entries, finding.path.front()) == unit.entries.end()) {
        return false;
    }
    for (std::size_t i = 0; i + 1 < finding.path.size(); ++i) {
        const auto edges = graph.edges(finding.path[i]);
        const bool linked = std::ranges::any_of(edges, [&](const callgraph::Edge& edge) {
            return edge.callee == finding.path[i + 1]
                   && graph.site(edge.site).id == finding.steps[i].call_site;
        });
        if (!linked) {
            return false;
        }
    }
    return intrinsics.functions[finding.path.back()].capabilities.contains(finding.capability);
}

}  // namespace capslock::attribution
