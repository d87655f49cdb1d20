#pragma once

/**
 * @file matcher.hpp
 * @brief Intrinsic capability tagging of call graph functions
 */

#include "capslock/callgraph.hpp"
#include "capslock/capability.hpp"
#include "capslock/rules.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capslock::matcher {

/// Why a function holds an intrinsic capability.
enum class EvidenceKind {
    kRule,                  ///< A rule matched the function's name
    kUnmatchedExternal,     ///< External function no rule covers
    kUnsupportedConstruct,  ///< A construct in the body could not be modelled
    kUnresolvedCall,        ///< A callee is missing from the closure
};

[[nodiscard]] std::string_view to_string(EvidenceKind kind);

struct IntrinsicTag
{
    Capability capability = Capability::kUnanalyzed;
    EvidenceKind kind = EvidenceKind::kRule;
    std::string detail;   ///< Rule pattern or gap description
    std::string site_id;  ///< Call site of the gap, empty for rule tags
};

struct FunctionIntrinsics
{
    CapabilitySet capabilities;
    std::vector<IntrinsicTag> tags;  ///< One per capability, taxonomy order
    const rules::CapabilityRule* rule = nullptr;
};

struct RuleAmbiguity
{
    std::string symbol;
    std::string chosen_pattern;
    std::vector<std::string> tied_patterns;
};

struct Classification
{
    std::vector<FunctionIntrinsics> functions;  ///< Indexed by FunctionId
    std::vector<RuleAmbiguity> ambiguities;     ///< In FunctionId order
};

/**
 * Attach intrinsic capabilities to every function.
 *
 * Rule match: the winning rule's capabilities (a tie uses the first declared
 * rule and records a RuleAmbiguity). External function without a match:
 * UNANALYZED. Every gap on a function adds UNANALYZED.
 */
[[nodiscard]] Classification classify(const callgraph::CallGraph& graph, const rules::RuleTable& table);

}  // namespace capslock::matcher
