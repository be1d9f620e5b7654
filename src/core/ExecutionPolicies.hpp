#pragma once

/**
 * @file ExecutionPolicies.hpp
 * @brief Execution policy types for running independent pipelines
 */

#ifdef HAVE_TBB
#include <tbb/task_group.h>
#endif

#include <functional>
#include <vector>

namespace rxgis {

struct SequentialPolicy {};
struct ParallelPolicy {};

using PipelineTask = std::function<void()>;

inline constexpr bool parallel_execution_available() {
#ifdef HAVE_TBB
    return true;
#else
    return false;
#endif
}

/**
 * @brief Run tasks one after another in the given order
 */
inline void run_tasks(SequentialPolicy, const std::vector<PipelineTask>& tasks) {
    for (const auto& task : tasks) {
        task();
    }
}

/**
 * @brief Run tasks concurrently and wait for all of them
 *
 * Falls back to sequential execution when built without TBB. Tasks must
 * not share mutable state.
 */
inline void run_tasks(ParallelPolicy, const std::vector<PipelineTask>& tasks) {
#ifdef HAVE_TBB
    tbb::task_group group;
    for (const auto& task : tasks) {
        group.run(task);
    }
    group.wait();
#else
    run_tasks(SequentialPolicy{}, tasks);
#endif
}

} // namespace rxgis
