#pragma once

/**
 * @file propagation.hpp
 * @brief Transitive capability propagation over the call graph
 *
 * reachable(f) = intrinsic(f) united with reachable(g) for every edge f->g,
 * computed exactly over strongly connected components.
 */

#include "capslock/budget.hpp"
#include "capslock/callgraph.hpp"
#include "capslock/capability.hpp"
#include "capslock/matcher.hpp"

#include <cstdint>
#include <vector>

namespace capslock::propagation {

using ComponentId = std::uint32_t;

/**
 * @brief SCC condensation of a call graph
 *
 * Components are numbered in reverse topological order: every successor of
 * a component has a smaller id.
 */
struct Condensation
{
    std::vector<ComponentId> component_of;                 ///< Indexed by FunctionId
    std::vector<std::vector<callgraph::FunctionId>> members;
    std::vector<std::vector<ComponentId>> successors;      ///< Sorted, self loops removed
    std::vector<std::vector<ComponentId>> layers;          ///< layers[0] has no successors
};

/// Iterative Tarjan SCC; uses no recursion regardless of graph depth.
[[nodiscard]] Condensation condense(const callgraph::CallGraph& graph);

struct PropagationOptions
{
    unsigned jobs = 1;  ///< Components of one layer are solved concurrently
};

struct Propagation
{
    std::vector<CapabilitySet> reachable;  ///< Indexed by FunctionId
    Condensation condensation;
};

/**
 * Solve reachable sets layer by layer.
 * @param budget Checked before each layer; nullptr disables the check
 * @return Result, or BudgetExceeded with no partial sets
 */
[[nodiscard]] capslock::Result<Propagation> propagate(const callgraph::CallGraph& graph,
                                                      const matcher::Classification& intrinsics,
                                                      const PropagationOptions& options,
                                                      BudgetTracker* budget);

}  // namespace capslock::propagation
