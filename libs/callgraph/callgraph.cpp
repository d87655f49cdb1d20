/**
 * @file callgraph.cpp
 * @brief Call graph construction: symbol resolution and indirect candidate sets
 */

#include "capslock/callgraph.hpp"

#include "capslock/logging.hpp"
#include "capslock/parallel.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <thread>
#include <unordered_set>

#include <fmt/format.h>

namespace capslock::callgraph {

namespace {

/// A function body to scan. Bodies of dropped duplicate definitions are
/// merged into the kept node; their site ids carry the module id prefix.
struct Body
{
    FunctionId id = kInvalidFunction;
    const ir::Function* function = nullptr;
    bool merged = false;
};

/// Per-module scan output, written by exactly one worker.
struct ModuleScan
{
    struct FunctionScan
    {
        FunctionId id = kInvalidFunction;
        std::vector<CallSite> sites;
        std::vector<ir::Gap> gaps;
    };
    std::vector<FunctionScan> functions;
};

class CandidateIndex
{
public:
    CandidateIndex(const std::vector<FunctionNode>& nodes, IndirectPolicy policy)
        : m_nodes(nodes)
    {
        for (FunctionId id = 0; id < nodes.size(); ++id) {
            if (policy == IndirectPolicy::kAddressTaken && !nodes[id].address_taken) {
                continue;
            }
            if (nodes[id].signature.variadic) {
                m_variadic.push_back(id);
            } else {
                m_by_key[nodes[id].signature.key()].push_back(id);
            }
        }
    }

    /// Precompute candidate sets so workers only read.
    void prepare(const ir::Signature& call)
    {
        auto key = call.key();
        if (m_sets.contains(key)) {
            return;
        }
        std::vector<FunctionId> candidates;
        if (auto it = m_by_key.find(key); it != m_by_key.end()) {
            candidates = it->second;
        }
        for (FunctionId id : m_variadic) {
            if (signature_compatible(call, m_nodes[id].signature)) {
                candidates.push_back(id);
            }
        }
        sort_by_symbol(candidates);
        m_sets.emplace(std::move(key), std::move(candidates));
    }

    [[nodiscard]] const std::vector<FunctionId>& candidates(const std::string& key) const
    {
        return m_sets.at(key);
    }

    void sort_by_symbol(std::vector<FunctionId>& ids) const
    {
        std::ranges::sort(ids, [this](FunctionId lhs, FunctionId rhs) {
            return m_nodes[lhs].symbol < m_nodes[rhs].symbol;
        });
        auto [first, last] = std::ranges::unique(ids);
        ids.erase(first, last);
    }

private:
    const std::vector<FunctionNode>& m_nodes;
    std::unordered_map<std::string, std::vector<FunctionId>> m_by_key;
    std::vector<FunctionId> m_variadic;
    std::unordered_map<std::string, std::vector<FunctionId>> m_sets;
};

[[nodiscard]] ir::Gap make_gap(const ir::CallInst& call,
                               const std::string& site_id,
                               const char* code,
                               std::string detail)
{
    return ir::Gap{.site_id = site_id, .code = code, .detail = std::move(detail), .src = call.src};
}

}  // namespace

bool signature_compatible(const ir::Signature& call, const ir::Signature& target)
{
    if (call.return_type != target.return_type) {
        return false;
    }
    if (!target.variadic) {
        return !call.variadic && call.params == target.params;
    }
    if (call.params.size() < target.params.size()) {
        return false;
    }
    return std::equal(target.params.begin(), target.params.end(), call.params.begin());
}

unsigned effective_jobs(unsigned jobs)
{
    if (jobs != 0) {
        return jobs;
    }
    return std::max(1U, std::thread::hardware_concurrency());
}

std::optional<FunctionId> CallGraph::find(std::string_view symbol) const
{
    if (auto it = m_index.find(std::string(symbol)); it != m_index.end()) {
        return it->second;
    }
    return std::nullopt;
}

capslock::Result<CallGraph> build_call_graph(const ir::Program& program, const BuildOptions& options)
{
    CallGraph graph;

    std::vector<std::size_t> module_order(program.modules.size());
    std::iota(module_order.begin(), module_order.end(), std::size_t{0});
    std::ranges::stable_sort(module_order, [&program](std::size_t lhs, std::size_t rhs) {
        return program.modules[lhs].module_id < program.modules[rhs].module_id;
    });

    // Node creation: definitions win over declarations, first definition wins over later ones.
    // Later definitions of a kept symbol are still scanned and merged into it.
    std::vector<std::vector<Body>> bodies_by_module(module_order.size());
    std::unordered_set<std::string> address_refs;
    for (std::size_t slot = 0; slot < module_order.size(); ++slot) {
        const ir::Module& module = program.modules[module_order[slot]];
        address_refs.insert(module.address_refs.begin(), module.address_refs.end());
        for (const auto& global : module.globals) {
            address_refs.insert(global.refs.begin(), global.refs.end());
        }
        for (const ir::Function& function : module.functions) {
            auto [it, inserted] =
                graph.m_index.try_emplace(function.symbol, static_cast<FunctionId>(graph.m_nodes.size()));
            if (!inserted) {
                FunctionNode& existing = graph.m_nodes[it->second];
                existing.address_taken = existing.address_taken || function.address_taken;
                if (function.external) {
                    continue;
                }
                if (!existing.external) {
                    CAPSLOCK_LOG_WARN(kGraph,
                                      "duplicate definition of {} in {}; keeping {} and merging its calls",
                                      function.symbol,
                                      module.module_id,
                                      existing.module_id);
                    graph.m_duplicates.push_back(DuplicateDefinition{.symbol = function.symbol,
                                                                     .kept_module = existing.module_id,
                                                                     .dropped_module = module.module_id});
                    bodies_by_module[slot].push_back(Body{.id = it->second, .function = &function, .merged = true});
                    continue;
                }
            } else {
                graph.m_nodes.emplace_back();
            }
            FunctionNode& node = graph.m_nodes[it->second];
            const bool address_taken = node.address_taken || function.address_taken;
            node = FunctionNode{.symbol = function.symbol,
                                .display_name = function.display_name.empty() ? function.symbol
                                                                              : function.display_name,
                                .unit = function.unit.empty() ? module.unit : function.unit,
                                .module_id = module.module_id,
                                .external = function.external,
                                .entry = function.entry && !function.external,
                                .address_taken = address_taken,
                                .signature = function.signature,
                                .src = function.src,
                                .sites = {},
                                .gaps = function.gaps};
            if (!function.external) {
                bodies_by_module[slot].push_back(Body{.id = it->second, .function = &function, .merged = false});
            }
        }
    }
    for (FunctionNode& node : graph.m_nodes) {
        node.address_taken = node.address_taken || address_refs.contains(node.symbol);
    }

    CandidateIndex candidates(graph.m_nodes, options.indirect_policy);
    for (const auto& bodies : bodies_by_module) {
        for (const Body& body : bodies) {
            for (const ir::CallInst& call : body.function->calls) {
                if (call.kind == ir::CallKind::kIndirect && !call.candidates.has_value()) {
                    candidates.prepare(call.signature);
                }
            }
        }
    }

    // Per-module scans; each worker writes only scans[slot].
    std::vector<ModuleScan> scans(bodies_by_module.size());
    const auto scan_module = [&](std::size_t slot) {
        ModuleScan& scan = scans[slot];
        const std::string& module_id = program.modules[module_order[slot]].module_id;
        for (const Body& body : bodies_by_module[slot]) {
            ModuleScan::FunctionScan out{.id = body.id, .sites = {}, .gaps = {}};
            const auto site_id = [&](const std::string& id) {
                return body.merged ? module_id + ":" + id : id;
            };
            if (body.merged) {
                for (ir::Gap gap : body.function->gaps) {
                    gap.site_id = site_id(gap.site_id);
                    out.gaps.push_back(std::move(gap));
                }
            }
            for (const ir::CallInst& call : body.function->calls) {
                CallSite site{.caller = body.id, .id = site_id(call.id), .target = {}, .src = call.src};
                if (call.kind == ir::CallKind::kDirect) {
                    if (auto callee = graph.find(call.callee)) {
                        site.target = DirectTarget{.callee = *callee};
                    } else {
                        site.target = UnresolvedTarget{.symbol = call.callee};
                        out.gaps.push_back(make_gap(call,
                                                    site.id,
                                                    error_code::kUnresolvedExternalCall,
                                                    "call to symbol missing from the closure: " + call.callee));
                    }
                    out.sites.push_back(std::move(site));
                    continue;
                }

                IndirectTargets targets{.signature_key = call.signature.key(), .candidates = {}, .enumerated = false};
                if (call.candidates.has_value()) {
                    targets.enumerated = true;
                    for (const auto& name : *call.candidates) {
                        if (auto callee = graph.find(name)) {
                            targets.candidates.push_back(*callee);
                        } else {
                            out.gaps.push_back(make_gap(call,
                                                        site.id,
                                                        error_code::kUnresolvedExternalCall,
                                                        "indirect candidate missing from the closure: " + name));
                        }
                    }
                    candidates.sort_by_symbol(targets.candidates);
                } else {
                    targets.candidates = candidates.candidates(targets.signature_key);
                }
                if (targets.candidates.empty()) {
                    out.gaps.push_back(make_gap(call,
                                                site.id,
                                                error_code::kUnsupportedConstruct,
                                                "indirect call with no candidate target for " + targets.signature_key));
                }
                site.target = std::move(targets);
                out.sites.push_back(std::move(site));
            }
            scan.functions.push_back(std::move(out));
        }
    };
    if (auto ran = parallel::run_batch(scans.size(), effective_jobs(options.jobs), scan_module); !ran) {
        return std::unexpected(ran.error());
    }

    // Merge in module order so site ids do not depend on scheduling.
    for (ModuleScan& scan : scans) {
        for (auto& function : scan.functions) {
            FunctionNode& node = graph.m_nodes[function.id];
            for (auto& site : function.sites) {
                node.sites.push_back(static_cast<SiteId>(graph.m_sites.size()));
                graph.m_sites.push_back(std::move(site));
            }
            node.gaps.insert(node.gaps.end(),
                             std::make_move_iterator(function.gaps.begin()),
                             std::make_move_iterator(function.gaps.end()));
        }
    }

    graph.m_edge_offsets.assign(graph.m_nodes.size() + 1, 0);
    for (FunctionId id = 0; id < graph.m_nodes.size(); ++id) {
        graph.m_edge_offsets[id] = graph.m_edges.size();
        for (SiteId site_id : graph.m_nodes[id].sites) {
            const CallSite& site = graph.m_sites[site_id];
            if (const auto* direct = std::get_if<DirectTarget>(&site.target)) {
                graph.m_edges.push_back(Edge{.callee = direct->callee, .site = site_id});
            } else if (const auto* indirect = std::get_if<IndirectTargets>(&site.target)) {
                for (FunctionId callee : indirect->candidates) {
                    graph.m_edges.push_back(Edge{.callee = callee, .site = site_id});
                }
            }
        }
    }
    graph.m_edge_offsets[graph.m_nodes.size()] = graph.m_edges.size();

    CAPSLOCK_LOG_INFO(kGraph,
                      "call graph: {} functions, {} call sites, {} edges, {} duplicate definitions",
                      graph.m_nodes.size(),
                      graph.m_sites.size(),
                      graph.m_edges.size(),
                      graph.m_duplicates.size());
    return graph;
}

}  // namespace capslock::callgraph
