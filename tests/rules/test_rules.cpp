/**
 * @file test_rules.cpp
 * @brief Rule table parsing and most-specific-pattern matching
 */

#include "capslock/rules.hpp"

#include "capslock/common.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace capslock::rules::test {

namespace {

RuleTable make_table(std::string_view text)
{
    auto table = RuleTable::from_capability_map(text, "test");
    EXPECT_TRUE(table) << table.error().message;
    return table ? std::move(*table) : RuleTable{};
}

nlohmann::json make_rules_doc()
{
    return nlohmann::json{
        {"schema_version",                                                        "caps_rules.v1"},
        {       "version",                                                           "2024.1"},
        {         "rules",
         nlohmann::json::array({{{"pattern", "std::fs::*"}, {"capabilities", {"FILESYSTEM"}}},
         {{"pattern", "getenv"}, {"capabilities", {"ENVIRONMENT", "READ_SYSTEM_STATE"}}}})}
    };
}

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

}  // namespace

TEST(RulesTest, PatternKinds)
{
    auto exact = make_rule("open", {"FILESYSTEM"}, 0);
    ASSERT_TRUE(exact);
    EXPECT_EQ(exact->kind, PatternKind::kExact);
    EXPECT_EQ(exact->stem, "open");

    auto prefix = make_rule("std::net::*", {"NETWORK"}, 1);
    ASSERT_TRUE(prefix);
    EXPECT_EQ(prefix->kind, PatternKind::kPrefix);
    EXPECT_EQ(prefix->stem, "std::net::");

    auto catch_all = make_rule("*", {"UNANALYZED"}, 2);
    ASSERT_TRUE(catch_all);
    EXPECT_EQ(catch_all->kind, PatternKind::kCatchAll);
}

TEST(RulesTest, InvalidRulesAreConfigurationErrors)
{
    for (const auto& [pattern, caps] : std::vector<std::pair<std::string, std::vector<std::string>>>{
             {   "a*b",       {"NETWORK"}},
             {      "",       {"NETWORK"}},
             {  "open",                {}},
             {  "open",   {"TELEPORTING"}},
             {  "open", {"SAFE", "NETWORK"}},
    }) {
        SCOPED_TRACE(pattern);
        auto rule = make_rule(pattern, caps, 0);
        ASSERT_FALSE(rule);
        EXPECT_EQ(rule.error().code, error_code::kConfigurationError);
    }
}

TEST(RulesTest, ExactBeatsPrefixBeatsCatchAll)
{
    auto table = make_table("*             UNANALYZED\n"
                            "std::*        RUNTIME\n"
                            "std::fs::*    FILESYSTEM\n"
                            "std::fs::read READ_SYSTEM_STATE\n");

    auto exact = table.match("std::fs::read", "std::fs::read", true);
    ASSERT_TRUE(exact);
    EXPECT_EQ(exact->rule->pattern, "std::fs::read");
    EXPECT_TRUE(exact->tied.empty());

    auto longest_prefix = table.match("std::fs::write", "std::fs::write", true);
    ASSERT_TRUE(longest_prefix);
    EXPECT_EQ(longest_prefix->rule->pattern, "std::fs::*");

    auto short_prefix = table.match("std::env::var", "std::env::var", true);
    ASSERT_TRUE(short_prefix);
    EXPECT_EQ(short_prefix->rule->pattern, "std::*");

    auto catch_all = table.match("mystery", "mystery", true);
    ASSERT_TRUE(catch_all);
    EXPECT_EQ(catch_all->rule->kind, PatternKind::kCatchAll);
}

TEST(RulesTest, CatchAllOnlyCoversExternalFunctions)
{
    auto table = make_table("* UNANALYZED\n");
    EXPECT_FALSE(table.match("local_helper", "local_helper", false).has_value());
    EXPECT_TRUE(table.match("local_helper", "local_helper", true).has_value());
}

TEST(RulesTest, DisplayNameAlsoMatches)
{
    auto table = make_table("std::fs::File::open FILESYSTEM\n");
    auto match = table.match("_ZN3std2fs4File4open17h0123E", "std::fs::File::open", true);
    ASSERT_TRUE(match);
    EXPECT_TRUE(match->rule->capabilities.contains(Capability::kFilesystem));
}

TEST(RulesTest, TiesPickFirstDeclaredRule)
{
    auto table = make_table("connect NETWORK\n"
                            "connect SYSTEM_CALLS\n");
    auto match = table.match("connect", "connect", true);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->rule->index, 0U);
    ASSERT_EQ(match->tied.size(), 1U);
    EXPECT_EQ(match->tied[0]->index, 1U);

    auto prefixes = make_table("net::* NETWORK\n"
                               "net::d* RUNTIME\n"
                               "net::* SYSTEM_CALLS\n");
    auto prefix_match = prefixes.match("net::dial", "net::dial", true);
    ASSERT_TRUE(prefix_match);
    EXPECT_EQ(prefix_match->rule->pattern, "net::d*");
    EXPECT_TRUE(prefix_match->tied.empty());

    auto tied_prefix = prefixes.match("net::listen", "net::listen", true);
    ASSERT_TRUE(tied_prefix);
    EXPECT_EQ(tied_prefix->rule->index, 0U);
    ASSERT_EQ(tied_prefix->tied.size(), 1U);
    EXPECT_EQ(tied_prefix->tied[0]->index, 2U);
}

TEST(RulesTest, SafeRulesMatchWithoutCapabilities)
{
    auto table = make_table("# Pure functions\n"
                            "\n"
                            "strlen CAPABILITY_SAFE\n"
                            "* UNANALYZED\n");
    ASSERT_EQ(table.rules().size(), 2U);
    auto match = table.match("strlen", "strlen", true);
    ASSERT_TRUE(match);
    EXPECT_TRUE(match->rule->capabilities.empty());
}

TEST(RulesTest, CapabilityMapAcceptsLegacyNames)
{
    auto table = make_table("os.Open CAPABILITY_FILES\r\n"
                            "   # indented comment\n"
                            "syscall.Exec CAPABILITY_EXEC CAPABILITY_SYSTEM_CALLS\n"
                            "runtime.mystery CAPABILITY_UNSPECIFIED\n");
    ASSERT_EQ(table.rules().size(), 3U);
    EXPECT_TRUE(table.rules()[0].capabilities.contains(Capability::kFilesystem));
    EXPECT_TRUE(table.rules()[1].capabilities.contains(Capability::kProcessExec));
    EXPECT_TRUE(table.rules()[1].capabilities.contains(Capability::kSystemCalls));
    EXPECT_EQ(table.rules()[2].capabilities, (CapabilitySet{Capability::kUnanalyzed}));
    EXPECT_EQ(table.version(), "test");
}

TEST(RulesTest, CapabilityMapErrorsNameTheLine)
{
    auto table = RuleTable::from_capability_map("ok NETWORK\nlonely\n", "caps.cm");
    ASSERT_FALSE(table);
    EXPECT_EQ(table.error().code, error_code::kConfigurationError);
    EXPECT_NE(table.error().message.find("caps.cm:2"), std::string::npos);
}

TEST(RulesTest, JsonTableLoadsAndValidates)
{
    auto table = RuleTable::from_json(make_rules_doc(), std::filesystem::path(CAPSLOCK_SCHEMA_DIR));
    ASSERT_TRUE(table) << table.error().message;
    EXPECT_EQ(table->version(), "2024.1");
    ASSERT_EQ(table->rules().size(), 2U);
    EXPECT_EQ(table->rules()[1].capabilities.size(), 2U);
    EXPECT_TRUE(table->digest().starts_with("sha256:"));

    auto bad = make_rules_doc();
    bad["rules"][0]["extra"] = 1;
    auto rejected = RuleTable::from_json(bad, std::filesystem::path(CAPSLOCK_SCHEMA_DIR));
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, error_code::kConfigurationError);
}

TEST(RulesTest, DigestDependsOnContent)
{
    auto first = make_table("open FILESYSTEM\n");
    auto same = make_table("# comment\nopen   FILESYSTEM\n");
    auto other = make_table("open NETWORK\n");
    EXPECT_EQ(first.digest(), same.digest());
    EXPECT_NE(first.digest(), other.digest());
}

TEST(RulesTest, LoadDispatchesOnExtension)
{
    auto temp_dir = ensure_temp_dir("capslock_rules_load");
    {
        std::ofstream out(temp_dir / "caps.cm");
        ASSERT_TRUE(out.is_open());
        out << "open FILESYSTEM\n";
    }
    {
        std::ofstream out(temp_dir / "caps.json");
        ASSERT_TRUE(out.is_open());
        out << make_rules_doc().dump(2);
    }

    auto map = RuleTable::load(temp_dir / "caps.cm", {});
    ASSERT_TRUE(map) << map.error().message;
    EXPECT_EQ(map->version(), "caps.cm");

    auto json = RuleTable::load(temp_dir / "caps.json", {});
    ASSERT_TRUE(json) << json.error().message;
    EXPECT_EQ(json->version(), "2024.1");

    auto missing = RuleTable::load(temp_dir / "nope.cm", {});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, error_code::kConfigurationError);
}

}  // namespace capslock::rules::test
