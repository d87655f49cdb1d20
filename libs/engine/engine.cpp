/**
 * @file engine.cpp
 * @brief Stage orchestration with a shared wall-clock budget
 */

#include "capslock/engine.hpp"

#include "capslock/canonical_json.hpp"
#include "capslock/loader.hpp"
#include "capslock/logging.hpp"

#include <algorithm>

namespace capslock {

namespace {

[[nodiscard]] std::vector<ModuleSummary> summarize_modules(const ir::Program& program)
{
    std::vector<ModuleSummary> modules;
    modules.reserve(program.modules.size());
    for (const auto& module : program.modules) {
        modules.push_back(ModuleSummary{.module_id = module.module_id,
                                        .unit = module.unit,
                                        .input_digest = module.input_digest});
    }
    std::ranges::sort(modules, {}, &ModuleSummary::module_id);
    return modules;
}

[[nodiscard]] capslock::Result<std::string> digest_inputs(const std::vector<ModuleSummary>& modules)
{
    nlohmann::json inputs = nlohmann::json::array();
    for (const auto& module : modules) {
        inputs.push_back(nlohmann::json{
            {   "module_id",    module.module_id},
            {"input_digest", module.input_digest}
        });
    }
    return canonical::hash_canonical(inputs);
}

}  // namespace

CapabilityType Analysis::type_of(callgraph::FunctionId id, Capability capability) const
{
    return classification.functions[id].capabilities.contains(capability) ? CapabilityType::kDirect
                                                                          : CapabilityType::kTransitive;
}

Engine::Engine(EngineConfig config)
    : m_config(std::move(config))
{}

capslock::Result<Analysis> Engine::analyze(const std::vector<std::filesystem::path>& inputs,
                                           const rules::RuleTable& table) const
{
    BudgetTracker budget(m_config.budget);
    auto program = loader::load_program(inputs,
                                        loader::LoadOptions{.schema_dir = m_config.schema_dir,
                                                            .strict = m_config.strict});
    if (!program) {
        return std::unexpected(program.error());
    }
    if (!budget.check_time()) {
        return std::unexpected(budget.exceeded_error("loading"));
    }
    return run(*program, table, budget);
}

capslock::Result<Analysis> Engine::analyze(const ir::Program& program, const rules::RuleTable& table) const
{
    BudgetTracker budget(m_config.budget);
    return run(program, table, budget);
}

capslock::Result<Analysis>
Engine::run(const ir::Program& program, const rules::RuleTable& table, BudgetTracker& budget) const
{
    Analysis analysis;
    analysis.modules = summarize_modules(program);
    auto input_digest = digest_inputs(analysis.modules);
    if (!input_digest) {
        return std::unexpected(input_digest.error());
    }
    analysis.input_digest = std::move(*input_digest);

    auto graph = callgraph::build_call_graph(
        program,
        callgraph::BuildOptions{.jobs = m_config.jobs, .indirect_policy = m_config.indirect_policy});
    if (!graph) {
        return std::unexpected(graph.error());
    }
    analysis.graph = std::move(*graph);
    if (!budget.check_functions(analysis.graph.size())) {
        return std::unexpected(budget.exceeded_error("call graph construction"));
    }

    analysis.classification = matcher::classify(analysis.graph, table);
    if (!budget.check_time()) {
        return std::unexpected(budget.exceeded_error("rule matching"));
    }

    auto propagation = propagation::propagate(analysis.graph,
                                              analysis.classification,
                                              propagation::PropagationOptions{.jobs = m_config.jobs},
                                              &budget);
    if (!propagation) {
        return std::unexpected(propagation.error());
    }
    analysis.propagation = std::move(*propagation);

    auto attribution = attribution::attribute(analysis.graph,
                                              analysis.classification,
                                              analysis.propagation,
                                              attribution::AttributionOptions{.jobs = m_config.jobs},
                                              &budget);
    if (!attribution) {
        return std::unexpected(attribution.error());
    }
    analysis.attribution = std::move(*attribution);
    if (!budget.check_time()) {
        return std::unexpected(budget.exceeded_error("attribution"));
    }

    CAPSLOCK_LOG_INFO(kCore,
                      "analysis complete: {} modules, {} functions, {} units in {} ms",
                      analysis.modules.size(),
                      analysis.graph.size(),
                      analysis.attribution.units.size(),
                      budget.elapsed_ms());
    return analysis;
}

}  // namespace capslock
