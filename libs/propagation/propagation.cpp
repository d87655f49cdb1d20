/**
 * @file propagation.cpp
 * @brief SCC condensation and layered fixed-point propagation
 */

#include "capslock/propagation.hpp"

#include "capslock/logging.hpp"
#include "capslock/parallel.hpp"

#include <algorithm>
#include <limits>

namespace capslock::propagation {

namespace {

constexpr std::uint32_t kUnvisited = std::numeric_limits<std::uint32_t>::max();

/// Explicit DFS frame: the node and the next outgoing edge to inspect.
struct Frame
{
    callgraph::FunctionId node;
    std::size_t next_edge;
};

class TarjanScc
{
public:
    explicit TarjanScc(const callgraph::CallGraph& graph)
        : m_graph(graph)
        , m_index(graph.size(), kUnvisited)
        , m_lowlink(graph.size(), 0)
        , m_on_stack(graph.size(), false)
    {
        m_result.component_of.assign(graph.size(), 0);
    }

    Condensation run()
    {
        for (callgraph::FunctionId root = 0; root < m_graph.size(); ++root) {
            if (m_index[root] == kUnvisited) {
                visit(root);
            }
        }
        return std::move(m_result);
    }

private:
    void open(callgraph::FunctionId node)
    {
        m_index[node] = m_next_index;
        m_lowlink[node] = m_next_index;
        ++m_next_index;
        m_stack.push_back(node);
        m_on_stack[node] = true;
        m_frames.push_back(Frame{.node = node, .next_edge = 0});
    }

    void visit(callgraph::FunctionId root)
    {
        open(root);
        while (!m_frames.empty()) {
            Frame& frame = m_frames.back();
            const auto edges = m_graph.edges(frame.node);
            if (frame.next_edge < edges.size()) {
                const callgraph::FunctionId callee = edges[frame.next_edge].callee;
                ++frame.next_edge;
                if (m_index[callee] == kUnvisited) {
                    open(callee);  // invalidates frame
                } else if (m_on_stack[callee]) {
                    m_lowlink[frame.node] = std::min(m_lowlink[frame.node], m_index[callee]);
                }
                continue;
            }

            const callgraph::FunctionId node = frame.node;
            m_frames.pop_back();
            if (!m_frames.empty()) {
                const callgraph::FunctionId parent = m_frames.back().node;
                m_lowlink[parent] = std::min(m_lowlink[parent], m_lowlink[node]);
            }
            if (m_lowlink[node] == m_index[node]) {
                close_component(node);
            }
        }
    }

    void close_component(callgraph::FunctionId root)
    {
        const auto id = static_cast<ComponentId>(m_result.members.size());
        std::vector<callgraph::FunctionId> members;
        callgraph::FunctionId member = callgraph::kInvalidFunction;
        do {
            member = m_stack.back();
            m_stack.pop_back();
            m_on_stack[member] = false;
            m_result.component_of[member] = id;
            members.push_back(member);
        } while (member != root);
        std::ranges::sort(members);
        m_result.members.push_back(std::move(members));
    }

    const callgraph::CallGraph& m_graph;
    std::vector<std::uint32_t> m_index;
    std::vector<std::uint32_t> m_lowlink;
    std::vector<bool> m_on_stack;
    std::vector<callgraph::FunctionId> m_stack;
    std::vector<Frame> m_frames;
    std::uint32_t m_next_index = 0;
    Condensation m_result;
};

void build_layers(const callgraph::CallGraph& graph, Condensation& condensation)
{
    const std::size_t count = condensation.members.size();
    condensation.successors.assign(count, {});
    std::vector<std::size_t> height(count, 0);
    std::size_t max_height = 0;

    // Tarjan emits sinks first, so every successor already has its height.
    for (ComponentId c = 0; c < count; ++c) {
        auto& successors = condensation.successors[c];
        for (callgraph::FunctionId member : condensation.members[c]) {
            for (const callgraph::Edge& edge : graph.edges(member)) {
                const ComponentId target = condensation.component_of[edge.callee];
                if (target != c) {
                    successors.push_back(target);
                }
            }
        }
        std::ranges::sort(successors);
        auto [first, last] = std::ranges::unique(successors);
        successors.erase(first, last);
        for (ComponentId successor : successors) {
            height[c] = std::max(height[c], height[successor] + 1);
        }
        max_height = std::max(max_height, height[c]);
    }

    condensation.layers.assign(count == 0 ? 0 : max_height + 1, {});
    for (ComponentId c = 0; c < count; ++c) {
        condensation.layers[height[c]].push_back(c);
    }
}

}  // namespace

Condensation condense(const callgraph::CallGraph& graph)
{
    Condensation condensation = TarjanScc(graph).run();
    build_layers(graph, condensation);
    return condensation;
}

capslock::Result<Propagation> propagate(const callgraph::CallGraph& graph,
                                        const matcher::Classification& intrinsics,
                                        const PropagationOptions& options,
                                        BudgetTracker* budget)
{
    if (intrinsics.functions.size() != graph.size()) {
        return std::unexpected(Error::make(error_code::kInternalError,
                                           "classification does not cover the call graph"));
    }

    Propagation result;
    result.condensation = condense(graph);
    const Condensation& condensation = result.condensation;

    CAPSLOCK_LOG_DEBUG(kPropagate,
                       "{} functions in {} components over {} layers",
                       graph.size(),
                       condensation.members.size(),
                       condensation.layers.size());

    // A component's set is written by one worker and read only by later layers.
    std::vector<CapabilitySet> component_sets(condensation.members.size());
    const unsigned jobs = callgraph::effective_jobs(options.jobs);

    for (std::size_t layer = 0; layer < condensation.layers.size(); ++layer) {
        if (budget != nullptr && !budget->check_time()) {
            CAPSLOCK_LOG_WARN(kPropagate,
                              "time budget exhausted after {} ms at layer {} of {}",
                              budget->elapsed_ms(),
                              layer,
                              condensation.layers.size());
            return std::unexpected(budget->exceeded_error("propagation"));
        }
        const auto& components = condensation.layers[layer];
        const auto solve = [&](std::size_t i) {
            const ComponentId c = components[i];
            CapabilitySet set;
            for (callgraph::FunctionId member : condensation.members[c]) {
                set.merge(intrinsics.functions[member].capabilities);
            }
            for (ComponentId successor : condensation.successors[c]) {
                set.merge(component_sets[successor]);
            }
            component_sets[c] = set;
        };
        if (auto ran = parallel::run_batch(components.size(), jobs, solve); !ran) {
            return std::unexpected(ran.error());
        }
    }

    result.reachable.resize(graph.size());
    for (callgraph::FunctionId id = 0; id < graph.size(); ++id) {
        result.reachable[id] = component_sets[condensation.component_of[id]];
    }
    return result;
}

}  // namespace capslock::propagation
