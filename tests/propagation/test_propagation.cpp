/**
 * @file test_propagation.cpp
 * @brief SCC condensation and transitive capability propagation
 */

#include "capslock/propagation.hpp"

#include "support/program_builder.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace capslock::propagation::test {

using capslock::test::make_program;
using capslock::test::make_signature;
using capslock::test::ModuleBuilder;

namespace {

struct Solved
{
    callgraph::CallGraph graph;
    rules::RuleTable table;
    matcher::Classification intrinsics;

    [[nodiscard]] callgraph::FunctionId id(const std::string& symbol) const
    {
        return graph.find(symbol).value();
    }
};

Solved prepare(const ir::Program& program, std::string_view rules_text)
{
    Solved solved;
    auto graph = callgraph::build_call_graph(program, callgraph::BuildOptions{});
    EXPECT_TRUE(graph) << graph.error().message;
    auto table = rules::RuleTable::from_capability_map(rules_text, "test");
    EXPECT_TRUE(table) << table.error().message;
    if (graph && table) {
        solved.graph = std::move(*graph);
        solved.table = std::move(*table);
        solved.intrinsics = matcher::classify(solved.graph, solved.table);
    }
    return solved;
}

Propagation run(const Solved& solved, unsigned jobs = 1)
{
    auto result = propagate(solved.graph, solved.intrinsics, PropagationOptions{.jobs = jobs}, nullptr);
    EXPECT_TRUE(result) << result.error().message;
    return result ? std::move(*result) : Propagation{};
}

ir::Module make_layered_module()
{
    ModuleBuilder builder("app", "app");
    builder.entry("main").declare("open_file").declare("connect").declare("getenv");
    builder.define("a").define("b").define("c").define("d");
    builder.call("main", "a").call("main", "b");
    builder.call("a", "c").call("b", "c").call("b", "d");
    builder.call("c", "open_file").call("d", "connect").call("d", "getenv");
    return builder.build();
}

constexpr std::string_view kRules = "open_file FILESYSTEM\n"
                                    "connect NETWORK\n"
                                    "getenv ENVIRONMENT\n";

}  // namespace

TEST(PropagationTest, UnionOfCalleesAndIntrinsics)
{
    auto solved = prepare(make_program({make_layered_module()}), kRules);
    auto result = run(solved);

    EXPECT_EQ(result.reachable[solved.id("c")], (CapabilitySet{Capability::kFilesystem}));
    EXPECT_EQ(result.reachable[solved.id("d")],
              (CapabilitySet{Capability::kNetwork, Capability::kEnvironment}));
    EXPECT_EQ(result.reachable[solved.id("a")], (CapabilitySet{Capability::kFilesystem}));
    EXPECT_EQ(result.reachable[solved.id("main")],
              (CapabilitySet{Capability::kFilesystem, Capability::kNetwork, Capability::kEnvironment}));
}

TEST(PropagationTest, CallerSetsContainCalleeSets)
{
    auto solved = prepare(make_program({make_layered_module()}), kRules);
    auto result = run(solved);

    for (callgraph::FunctionId id = 0; id < solved.graph.size(); ++id) {
        EXPECT_TRUE(solved.intrinsics.functions[id].capabilities.is_subset_of(result.reachable[id]));
        for (const callgraph::Edge& edge : solved.graph.edges(id)) {
            EXPECT_TRUE(result.reachable[edge.callee].is_subset_of(result.reachable[id]))
                << solved.graph.node(id).symbol << " -> " << solved.graph.node(edge.callee).symbol;
        }
    }
}

TEST(PropagationTest, MutualRecursionSharesOneSet)
{
    auto app = ModuleBuilder("app", "app")
                   .entry("ping")
                   .define("pong")
                   .declare("send")
                   .call("ping", "pong")
                   .call("pong", "ping")
                   .call("pong", "send")
                   .build();
    auto solved = prepare(make_program({app}), "send NETWORK\n");
    auto result = run(solved);

    EXPECT_EQ(result.reachable[solved.id("ping")], (CapabilitySet{Capability::kNetwork}));
    EXPECT_EQ(result.reachable[solved.id("pong")], (CapabilitySet{Capability::kNetwork}));
    const auto& condensation = result.condensation;
    EXPECT_EQ(condensation.component_of[solved.id("ping")], condensation.component_of[solved.id("pong")]);
}

TEST(PropagationTest, SelfRecursionTerminates)
{
    auto app = ModuleBuilder("app", "app").entry("loop").call("loop", "loop").build();
    auto solved = prepare(make_program({app}), "open_file FILESYSTEM\n");
    auto result = run(solved);

    EXPECT_TRUE(result.reachable[solved.id("loop")].empty());
    ASSERT_EQ(result.condensation.members.size(), 1U);
    EXPECT_TRUE(result.condensation.successors[0].empty());
}

TEST(PropagationTest, CondensationIsReverseTopological)
{
    auto solved = prepare(make_program({make_layered_module()}), kRules);
    auto condensation = condense(solved.graph);

    ASSERT_EQ(condensation.component_of.size(), solved.graph.size());
    for (ComponentId component = 0; component < condensation.successors.size(); ++component) {
        for (ComponentId successor : condensation.successors[component]) {
            EXPECT_LT(successor, component);
        }
    }
    ASSERT_FALSE(condensation.layers.empty());
    for (ComponentId component : condensation.layers[0]) {
        EXPECT_TRUE(condensation.successors[component].empty());
    }
    std::size_t layered = 0;
    for (const auto& layer : condensation.layers) {
        layered += layer.size();
    }
    EXPECT_EQ(layered, condensation.members.size());
}

TEST(PropagationTest, DeepChainDoesNotRecurse)
{
    constexpr int kDepth = 100000;
    ModuleBuilder builder("chain", "chain");
    builder.entry("f0");
    for (int i = 1; i < kDepth; ++i) {
        builder.define("f" + std::to_string(i));
    }
    builder.declare("open_file");
    for (int i = 0; i + 1 < kDepth; ++i) {
        builder.call("f" + std::to_string(i), "f" + std::to_string(i + 1));
    }
    builder.call("f" + std::to_string(kDepth - 1), "open_file");

    auto solved = prepare(make_program({builder.build()}), "open_file FILESYSTEM\n");
    auto result = run(solved, 4);

    EXPECT_EQ(result.reachable[solved.id("f0")], (CapabilitySet{Capability::kFilesystem}));
    EXPECT_EQ(result.condensation.members.size(), static_cast<std::size_t>(kDepth) + 1);
}

TEST(PropagationTest, ResultIndependentOfJobs)
{
    ModuleBuilder builder("wide", "wide");
    builder.entry("root").declare("open_file").declare("connect");
    for (int i = 0; i < 64; ++i) {
        const std::string name = "leaf" + std::to_string(i);
        builder.define(name, false, make_signature("void"));
        builder.call("root", name);
        builder.call(name, i % 2 == 0 ? "open_file" : "connect");
        if (i > 0) {
            builder.call(name, "leaf" + std::to_string(i - 1));
        }
    }
    auto solved = prepare(make_program({builder.build()}), "open_file FILESYSTEM\nconnect NETWORK\n");

    auto serial = run(solved, 1);
    auto parallel = run(solved, 8);
    EXPECT_EQ(serial.reachable, parallel.reachable);
    EXPECT_EQ(serial.condensation.component_of, parallel.condensation.component_of);
}

TEST(PropagationTest, ExhaustedBudgetFailsWithoutResult)
{
    auto solved = prepare(make_program({make_layered_module()}), kRules);
    BudgetTracker budget(AnalysisBudget{.max_time_ms = std::nullopt, .max_functions = 1});
    EXPECT_FALSE(budget.check_functions(solved.graph.size()));

    auto result = propagate(solved.graph, solved.intrinsics, PropagationOptions{}, &budget);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, error_code::kBudgetExceeded);
    EXPECT_NE(result.error().message.find("max_functions"), std::string::npos);
}

TEST(PropagationTest, GenerousBudgetIsHarmless)
{
    auto solved = prepare(make_program({make_layered_module()}), kRules);
    BudgetTracker budget(AnalysisBudget{.max_time_ms = 600000, .max_functions = std::nullopt});

    auto result = propagate(solved.graph, solved.intrinsics, PropagationOptions{}, &budget);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_FALSE(budget.exceeded());
}

}  // namespace capslock::propagation::test
