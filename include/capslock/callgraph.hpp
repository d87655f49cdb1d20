#pragma once

/**
 * @file callgraph.hpp
 * @brief Whole-program call graph over the loaded dependency closure
 *
 * Functions live in an arena indexed by FunctionId. The graph is immutable
 * after build_call_graph() returns and may be read from any thread.
 */

#include "capslock/common.hpp"
#include "capslock/ir.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace capslock::callgraph {

using FunctionId = std::uint32_t;
using SiteId = std::uint32_t;

inline constexpr FunctionId kInvalidFunction = std::numeric_limits<FunctionId>::max();

struct DirectTarget
{
    FunctionId callee = kInvalidFunction;
};

struct IndirectTargets
{
    std::string signature_key;
    std::vector<FunctionId> candidates;  ///< Sorted by symbol
    bool enumerated = false;             ///< Candidates came from the IR, not a signature scan
};

/// Callee symbol not defined or declared anywhere in the closure.
struct UnresolvedTarget
{
    std::string symbol;
};

using CallTarget = std::variant<DirectTarget, IndirectTargets, UnresolvedTarget>;

struct CallSite
{
    FunctionId caller = kInvalidFunction;
    std::string id;
    CallTarget target;
    std::optional<ir::Location> src;
};

struct FunctionNode
{
    std::string symbol;
    std::string display_name;
    std::string unit;
    std::string module_id;
    bool external = false;
    bool entry = false;
    bool address_taken = false;
    ir::Signature signature;
    std::optional<ir::Location> src;
    std::vector<SiteId> sites;  ///< Declaration order, merged duplicate bodies last
    std::vector<ir::Gap> gaps;  ///< Loader gaps plus unresolved or target-less calls
};

/// One resolved caller-to-callee edge; an indirect site yields one edge per candidate.
struct Edge
{
    FunctionId callee = kInvalidFunction;
    SiteId site = 0;
};

/// A later definition whose body was merged into the kept node.
struct DuplicateDefinition
{
    std::string symbol;
    std::string kept_module;
    std::string dropped_module;
};

enum class IndirectPolicy {
    kSignature,     ///< Every signature-compatible function
    kAddressTaken,  ///< Only address-taken signature-compatible functions
};

struct BuildOptions
{
    unsigned jobs = 1;  ///< Worker threads for per-module scans (0 = hardware concurrency)
    IndirectPolicy indirect_policy = IndirectPolicy::kSignature;
};

class CallGraph
{
public:
    [[nodiscard]] std::size_t size() const { return m_nodes.size(); }
    [[nodiscard]] const FunctionNode& node(FunctionId id) const { return m_nodes[id]; }
    [[nodiscard]] const std::vector<FunctionNode>& nodes() const { return m_nodes; }
    [[nodiscard]] const CallSite& site(SiteId id) const { return m_sites[id]; }
    [[nodiscard]] const std::vector<CallSite>& sites() const { return m_sites; }
    [[nodiscard]] const std::vector<DuplicateDefinition>& duplicates() const { return m_duplicates; }

    /// Outgoing edges of a function in call-site order.
    [[nodiscard]] std::span<const Edge> edges(FunctionId id) const
    {
        return std::span<const Edge>(m_edges).subspan(m_edge_offsets[id],
                                                      m_edge_offsets[id + 1] - m_edge_offsets[id]);
    }

    [[nodiscard]] std::optional<FunctionId> find(std::string_view symbol) const;

private:
    friend capslock::Result<CallGraph> build_call_graph(const ir::Program& program,
                                                        const BuildOptions& options);

    std::vector<FunctionNode> m_nodes;
    std::vector<CallSite> m_sites;
    std::vector<Edge> m_edges;
    std::vector<std::size_t> m_edge_offsets;
    std::vector<DuplicateDefinition> m_duplicates;
    std::unordered_map<std::string, FunctionId> m_index;
};

/**
 * Build the call graph for a whole program.
 *
 * Direct calls resolve by exact symbol across all modules; a definition wins
 * over declarations. Indirect calls get their IR-enumerated candidates or
 * every signature-compatible function. Calls to symbols absent from the
 * closure become UnresolvedTarget sites plus an UnresolvedExternalCall gap.
 *
 * A symbol defined in several modules keeps the node of the first module in
 * module_id order; the call sites and gaps of every later body are merged
 * into it with site ids prefixed by "<module_id>:".
 */
[[nodiscard]] capslock::Result<CallGraph> build_call_graph(const ir::Program& program,
                                                           const BuildOptions& options);

/**
 * True if a function with signature target may be called through a
 * pointer of type call: equal return and parameter types, or, for a
 * variadic target, fixed parameters that prefix the call's parameters.
 */
[[nodiscard]] bool signature_compatible(const ir::Signature& call, const ir::Signature& target);

/// Resolve a jobs setting (0 = hardware concurrency, at least 1).
[[nodiscard]] unsigned effective_jobs(unsigned jobs);

}  // namespace capslock::callgraph
