#pragma once

/**
 * @file engine.hpp
 * @brief End-to-end capability analysis over a dependency closure
 *
 * The engine holds no global state; separate Engine instances may run
 * concurrently. A run either returns a complete Analysis or one fatal Error.
 */

#include "capslock/attribution.hpp"
#include "capslock/callgraph.hpp"
#include "capslock/config.hpp"
#include "capslock/ir.hpp"
#include "capslock/matcher.hpp"
#include "capslock/propagation.hpp"
#include "capslock/rules.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace capslock {

struct ModuleSummary
{
    std::string module_id;
    std::string unit;
    std::string input_digest;
};

/**
 * @brief Every stage's output for one run
 *
 * classification refers to rules inside the RuleTable passed to analyze(),
 * which must outlive the Analysis.
 */
struct Analysis
{
    std::vector<ModuleSummary> modules;  ///< Sorted by module_id
    std::string input_digest;            ///< Digest over the module digests
    callgraph::CallGraph graph;
    matcher::Classification classification;
    propagation::Propagation propagation;
    attribution::Attribution attribution;

    /// kDirect if the function holds the capability intrinsically.
    [[nodiscard]] CapabilityType type_of(callgraph::FunctionId id, Capability capability) const;
};

class Engine
{
public:
    explicit Engine(EngineConfig config);

    /// Load every artifact then analyze; loading errors are fatal.
    [[nodiscard]] capslock::Result<Analysis> analyze(const std::vector<std::filesystem::path>& inputs,
                                                     const rules::RuleTable& table) const;

    [[nodiscard]] capslock::Result<Analysis> analyze(const ir::Program& program,
                                                     const rules::RuleTable& table) const;

    [[nodiscard]] const EngineConfig& config() const { return m_config; }

private:
    [[nodiscard]] capslock::Result<Analysis>
    run(const ir::Program& program, const rules::RuleTable& table, BudgetTracker& budget) const;

    EngineConfig m_config;
};

}  // namespace capslock
