/**
 * @file test_matcher.cpp
 * @brief Intrinsic tagging from rules, unmatched externals and gaps
 */

#include "capslock/matcher.hpp"

#include "support/program_builder.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace capslock::matcher::test {

using capslock::test::make_program;
using capslock::test::ModuleBuilder;

namespace {

struct Fixture
{
    callgraph::CallGraph graph;
    rules::RuleTable table;
    Classification classification;

    [[nodiscard]] const FunctionIntrinsics& of(const std::string& symbol) const
    {
        return classification.functions.at(graph.find(symbol).value());
    }
};

Fixture classify_program(const ir::Program& program, std::string_view rules_text)
{
    Fixture fixture;
    auto graph = callgraph::build_call_graph(program, callgraph::BuildOptions{});
    EXPECT_TRUE(graph) << graph.error().message;
    auto table = rules::RuleTable::from_capability_map(rules_text, "test");
    EXPECT_TRUE(table) << table.error().message;
    if (graph && table) {
        fixture.graph = std::move(*graph);
        fixture.table = std::move(*table);
        fixture.classification = classify(fixture.graph, fixture.table);
    }
    return fixture;
}

}  // namespace

TEST(MatcherTest, RuleCapabilitiesBecomeIntrinsic)
{
    auto app = ModuleBuilder("app", "app")
                   .entry("run")
                   .declare("open_file")
                   .declare("exec_shell")
                   .call("run", "open_file")
                   .call("run", "exec_shell")
                   .build();
    auto fixture = classify_program(make_program({app}),
                                    "open_file FILESYSTEM\n"
                                    "exec_* PROCESS_EXEC FILESYSTEM\n");

    const auto& open_file = fixture.of("open_file");
    EXPECT_EQ(open_file.capabilities, (CapabilitySet{Capability::kFilesystem}));
    ASSERT_EQ(open_file.tags.size(), 1U);
    EXPECT_EQ(open_file.tags[0].kind, EvidenceKind::kRule);
    EXPECT_EQ(open_file.tags[0].detail, "open_file");
    ASSERT_NE(open_file.rule, nullptr);

    const auto& exec_shell = fixture.of("exec_shell");
    ASSERT_EQ(exec_shell.tags.size(), 2U);
    EXPECT_EQ(exec_shell.tags[0].capability, Capability::kFilesystem);
    EXPECT_EQ(exec_shell.tags[1].capability, Capability::kProcessExec);

    EXPECT_TRUE(fixture.of("run").capabilities.empty());
    EXPECT_TRUE(fixture.classification.ambiguities.empty());
}

TEST(MatcherTest, UnmatchedExternalIsUnanalyzed)
{
    auto app = ModuleBuilder("app", "app").entry("run").declare("mystery").call("run", "mystery").build();
    auto fixture = classify_program(make_program({app}), "open_file FILESYSTEM\n");

    const auto& mystery = fixture.of("mystery");
    EXPECT_TRUE(mystery.capabilities.contains(Capability::kUnanalyzed));
    ASSERT_EQ(mystery.tags.size(), 1U);
    EXPECT_EQ(mystery.tags[0].kind, EvidenceKind::kUnmatchedExternal);
    EXPECT_TRUE(fixture.of("run").capabilities.empty());
}

TEST(MatcherTest, SafeRuleClearsExternal)
{
    auto app = ModuleBuilder("app", "app").entry("run").declare("strlen").call("run", "strlen").build();
    auto fixture = classify_program(make_program({app}), "strlen SAFE\n* UNANALYZED\n");

    const auto& strlen_fn = fixture.of("strlen");
    EXPECT_TRUE(strlen_fn.capabilities.empty());
    ASSERT_NE(strlen_fn.rule, nullptr);
    EXPECT_EQ(strlen_fn.rule->pattern, "strlen");
}

TEST(MatcherTest, GapsAddUnanalyzedWithSite)
{
    auto app = ModuleBuilder("app", "app")
                   .entry("run")
                   .gap("run", "I7", "inline assembly")
                   .call("run", "vanished")
                   .build();
    auto fixture = classify_program(make_program({app}), "open_file FILESYSTEM\n");

    const auto& run = fixture.of("run");
    EXPECT_EQ(run.capabilities, (CapabilitySet{Capability::kUnanalyzed}));
    ASSERT_EQ(run.tags.size(), 1U);
    EXPECT_EQ(run.tags[0].kind, EvidenceKind::kUnsupportedConstruct);
    EXPECT_EQ(run.tags[0].site_id, "I7");
    EXPECT_EQ(run.tags[0].detail, "inline assembly");
}

TEST(MatcherTest, UnresolvedCallEvidence)
{
    auto app = ModuleBuilder("app", "app").entry("run").call("run", "vanished").build();
    auto fixture = classify_program(make_program({app}), "open_file FILESYSTEM\n");

    const auto& run = fixture.of("run");
    ASSERT_EQ(run.tags.size(), 1U);
    EXPECT_EQ(run.tags[0].kind, EvidenceKind::kUnresolvedCall);
    EXPECT_EQ(run.tags[0].site_id, "run#0");
}

TEST(MatcherTest, AmbiguousRulesAreRecorded)
{
    auto app = ModuleBuilder("app", "app").entry("run").declare("connect").call("run", "connect").build();
    auto fixture = classify_program(make_program({app}),
                                    "connect NETWORK\n"
                                    "connect SYSTEM_CALLS\n");

    EXPECT_EQ(fixture.of("connect").capabilities, (CapabilitySet{Capability::kNetwork}));
    ASSERT_EQ(fixture.classification.ambiguities.size(), 1U);
    const auto& ambiguity = fixture.classification.ambiguities[0];
    EXPECT_EQ(ambiguity.symbol, "connect");
    EXPECT_EQ(ambiguity.chosen_pattern, "connect");
    EXPECT_EQ(ambiguity.tied_patterns, std::vector<std::string>{"connect"});
}

TEST(MatcherTest, RulesApplyToDefinedFunctions)
{
    auto app = ModuleBuilder("app", "app").entry("run").define("getenv").call("run", "getenv").build();
    auto fixture = classify_program(make_program({app}), "getenv ENVIRONMENT\n* UNANALYZED\n");

    EXPECT_EQ(fixture.of("getenv").capabilities, (CapabilitySet{Capability::kEnvironment}));
    EXPECT_TRUE(fixture.of("run").capabilities.empty());
}

TEST(MatcherTest, EvidenceKindNames)
{
    EXPECT_EQ(to_string(EvidenceKind::kRule), "rule");
    EXPECT_EQ(to_string(EvidenceKind::kUnmatchedExternal), "unmatched_external");
    EXPECT_EQ(to_string(EvidenceKind::kUnsupportedConstruct), "unsupported_construct");
    EXPECT_EQ(to_string(EvidenceKind::kUnresolvedCall), "unresolved_call");
}

}  // namespace capslock::matcher::test
