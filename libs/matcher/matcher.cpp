/**
 * @file matcher.cpp
 * @brief Intrinsic capability tagging from rules and recorded gaps
 */

#include "capslock/matcher.hpp"

#include "capslock/logging.hpp"

#include <algorithm>

namespace capslock::matcher {

namespace {

void add_tag(FunctionIntrinsics& out, IntrinsicTag tag)
{
    if (out.capabilities.contains(tag.capability)) {
        return;
    }
    out.capabilities.insert(tag.capability);
    out.tags.push_back(std::move(tag));
}

[[nodiscard]] EvidenceKind gap_evidence(const ir::Gap& gap)
{
    return gap.code == error_code::kUnresolvedExternalCall ? EvidenceKind::kUnresolvedCall
                                                           : EvidenceKind::kUnsupportedConstruct;
}

}  // namespace

std::string_view to_string(EvidenceKind kind)
{
    switch (kind) {
        case EvidenceKind::kRule:
            return "rule";
        case EvidenceKind::kUnmatchedExternal:
            return "unmatched_external";
        case EvidenceKind::kUnsupportedConstruct:
            return "unsupported_construct";
        case EvidenceKind::kUnresolvedCall:
            return "unresolved_call";
    }
    return "rule";
}

Classification classify(const callgraph::CallGraph& graph, const rules::RuleTable& table)
{
    Classification result;
    result.functions.resize(graph.size());

    std::size_t unmatched_external = 0;
    for (callgraph::FunctionId id = 0; id < graph.size(); ++id) {
        const callgraph::FunctionNode& node = graph.node(id);
        FunctionIntrinsics& out = result.functions[id];

        if (auto match = table.match(node.symbol, node.display_name, node.external)) {
            out.rule = match->rule;
            for (Capability capability : match->rule->capabilities.to_vector()) {
                add_tag(out,
                        IntrinsicTag{.capability = capability,
                                     .kind = EvidenceKind::kRule,
                                     .detail = match->rule->pattern,
                                     .site_id = {}});
            }
            if (!match->tied.empty()) {
                RuleAmbiguity ambiguity{.symbol = node.symbol,
                                        .chosen_pattern = match->rule->pattern,
                                        .tied_patterns = {}};
                for (const auto* tied : match->tied) {
                    ambiguity.tied_patterns.push_back(tied->pattern);
                }
                CAPSLOCK_LOG_WARN(kRules,
                                  "ambiguous rules for {}: using '{}' over {} other rule(s)",
                                  node.symbol,
                                  match->rule->pattern,
                                  match->tied.size());
                result.ambiguities.push_back(std::move(ambiguity));
            }
        } else if (node.external) {
            ++unmatched_external;
            CAPSLOCK_LOG_DEBUG(kRules, "no rule for external function {}", node.symbol);
            add_tag(out,
                    IntrinsicTag{.capability = Capability::kUnanalyzed,
                                 .kind = EvidenceKind::kUnmatchedExternal,
                                 .detail = "no rule matches external function " + node.symbol,
                                 .site_id = {}});
        }

        for (const ir::Gap& gap : node.gaps) {
            add_tag(out,
                    IntrinsicTag{.capability = Capability::kUnanalyzed,
                                 .kind = gap_evidence(gap),
                                 .detail = gap.detail,
                                 .site_id = gap.site_id});
        }
        std::ranges::stable_sort(out.tags, {}, &IntrinsicTag::capability);
    }

    CAPSLOCK_LOG_INFO(kRules,
                      "tagged {} functions; {} external functions without a rule, {} ambiguities",
                      graph.size(),
                      unmatched_external,
                      result.ambiguities.size());
    return result;
}

}  // namespace capslock::matcher
