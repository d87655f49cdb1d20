#pragma once

/**
 * @file budget.hpp
 * @brief Wall-clock budget shared by the pipeline stages
 */

#include "capslock/common.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace capslock {

struct AnalysisBudget
{
    std::optional<std::uint64_t> max_time_ms;
    std::optional<std::uint64_t> max_functions;  ///< Call graph size limit
};

/**
 * @brief Tracks elapsed time and graph size against an AnalysisBudget
 *
 * Checked between stages and propagation layers from the coordinating
 * thread only.
 */
class BudgetTracker
{
public:
    explicit BudgetTracker(AnalysisBudget budget)
        : m_budget(budget)
        , m_start_time(std::chrono::steady_clock::now())
    {}

    [[nodiscard]] bool exceeded() const { return m_exceeded_limit.has_value(); }

    /// Returns false once the time budget is exhausted.
    bool check_time()
    {
        if (exceeded()) {
            return false;
        }
        if (!m_budget.max_time_ms.has_value()) {
            return true;
        }
        if (elapsed_ms() > *m_budget.max_time_ms) {
            m_exceeded_limit = "max_time_ms";
            return false;
        }
        return true;
    }

    /// Returns false if the call graph holds more functions than allowed.
    bool check_functions(std::uint64_t count)
    {
        if (!check_time()) {
            return false;
        }
        if (m_budget.max_functions.has_value() && count > *m_budget.max_functions) {
            m_exceeded_limit = "max_functions";
            return false;
        }
        return true;
    }

    [[nodiscard]] std::uint64_t elapsed_ms() const
    {
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                              std::chrono::steady_clock::now() - m_start_time)
                                              .count());
    }

    /// BudgetExceeded error naming the stage that noticed it.
    [[nodiscard]] Error exceeded_error(std::string_view stage) const
    {
        return Error::make(error_code::kBudgetExceeded,
                           std::string("analysis budget exceeded (")
                               + m_exceeded_limit.value_or("max_time_ms") + ") during "
                               + std::string(stage) + "; no partial report is produced");
    }

private:
    AnalysisBudget m_budget;
    std::chrono::steady_clock::time_point m_start_time;
    std::optional<std::string> m_exceeded_limit;
};

}  // namespace capslock
