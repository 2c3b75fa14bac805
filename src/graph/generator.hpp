/**
 * @file generator.hpp
 * @brief Synthetic task graph generators for testing and benchmarking.
 */

#pragma once

#include "graph/function_task.hpp"

#include <random>
#include <vector>

namespace graph_solver {

/**
 * @brief Shared settings applied to every generated task.
 */
struct TaskTemplate {
    std::string type = "test";
    ActionState initial_state = ActionState::NotReady;
    TaskCallback get_status;
    TaskCallback process;
};

/**
 * @brief A generated graph: every task in creation order (dependencies first)
 * plus the tasks nothing depends on, which are what a caller submits.
 */
struct GeneratedGraph {
    std::vector<TaskPtr> tasks;
    std::vector<TaskPtr> roots;
};

/**
 * @brief Factory for synthetic task graphs with various topologies.
 */
class GraphGenerator {
public:
    /// Linear chain: chain_0 <- chain_1 <- ... <- chain_{n-1}
    static GeneratedGraph linear_chain(size_t num_tasks, const TaskTemplate& tmpl = {});

    /// Fan-out / fan-in: fan_src <- {fan_branch_i} <- fan_sink
    static GeneratedGraph fan_out_fan_in(size_t width, const TaskTemplate& tmpl = {});

    /// Repeated fan-out / fan-in, each level's merge feeding the next hub
    static GeneratedGraph diamond(size_t depth, size_t width, const TaskTemplate& tmpl = {});

    /// Random DAG; edges only point from lower to higher index
    static GeneratedGraph random_dag(size_t num_tasks,
                                     float edge_probability,
                                     std::mt19937& rng,
                                     const TaskTemplate& tmpl = {});
};

}  // namespace graph_solver
