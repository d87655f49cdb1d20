#pragma once

/**
 * @file parallel.hpp
 * @brief Batch execution of independent tasks on worker threads
 */

#include "capslock/common.hpp"

#include <cstddef>
#include <functional>

namespace capslock::parallel {

/**
 * Run task(i) for every i in [0, count) on up to jobs threads and join them.
 *
 * Each task must write only state owned by its index. The join is the
 * publication barrier: after return every task's writes are visible.
 * An exception escaping a task is reported as an Error after all workers
 * have joined.
 */
[[nodiscard]] capslock::VoidResult
run_batch(std::size_t count, unsigned jobs, const std::function<void(std::size_t)>& task);

}  // namespace capslock::parallel
