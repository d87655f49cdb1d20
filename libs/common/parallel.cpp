/**
 * @file parallel.cpp
 * @brief Worker-thread batch execution
 */

#include "capslock/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <thread>
#include <vector>

namespace capslock::parallel {

capslock::VoidResult
run_batch(std::size_t count, unsigned jobs, const std::function<void(std::size_t)>& task)
{
    if (count == 0) {
        return {};
    }
    const std::size_t worker_count = std::min<std::size_t>(std::max(1U, jobs), count);

    std::vector<std::exception_ptr> failures(worker_count);
    const auto worker_loop = [&task, &failures, count](std::atomic<std::size_t>& next, std::size_t worker) {
        try {
            for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                task(i);
            }
        } catch (...) {
            failures[worker] = std::current_exception();
            next.store(count);
        }
    };

    std::atomic<std::size_t> next{0};
    if (worker_count == 1) {
        worker_loop(next, 0);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back(worker_loop, std::ref(next), w);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    for (const auto& failure : failures) {
        if (!failure) {
            continue;
        }
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& ex) {
            return std::unexpected(Error::make("WorkerFailed", ex.what()));
        } catch (...) {
            return std::unexpected(Error::make("WorkerFailed", "worker raised a non-standard exception"));
        }
    }
    return {};
}

}  // namespace capslock::parallel
