#ifndef BIRCH_PARALLELIZE_HPP
#define BIRCH_PARALLELIZE_HPP

#include <utility>

/**
 * @file parallelize.hpp
 * @brief Utilities for parallelization.
 */

#ifndef BIRCH_CUSTOM_PARALLEL
#include "subpar/subpar.hpp"
#endif

namespace birch {

/**
 * Only the per-pseudo-point steps of the k-means stage are parallelized,
 * i.e., the distance updates in `InitializeKmeanspp` and the nearest-mean search in `RefineLloyd`.
 * Construction of the `CFTree` is always sequential as insertion order matters.
 *
 * @tparam Task_ Integer type of the number of tasks.
 * @tparam Run_ Function to execute a range of tasks.
 *
 * @param num_workers Number of workers.
 * @param num_tasks Number of tasks.
 * @param run_task_range Function to iterate over a range of tasks within a worker.
 * This should accept the worker index, the first task and the number of tasks.
 *
 * By default, this is an alias to `subpar::parallelize_range()`.
 * However, if the `BIRCH_CUSTOM_PARALLEL` function-like macro is defined, it is called instead.
 * Any user-defined macro should accept the same arguments as `subpar::parallelize_range()`.
 */
template<typename Task_, class Run_>
void parallelize(const int num_workers, const Task_ num_tasks, Run_ run_task_range) {
#ifndef BIRCH_CUSTOM_PARALLEL
    subpar::parallelize_range(num_workers, num_tasks, std::move(run_task_range));
#else
    BIRCH_CUSTOM_PARALLEL(num_workers, num_tasks, run_task_range);
#endif
}

}

#endif
