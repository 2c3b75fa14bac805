/**
 * @file function_task.hpp
 * @brief Callback-backed task variant built through make_task().
 */

#pragma once

#include "graph/task.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace graph_solver {

using TaskCallback = std::function<Result<TaskOutcome>(const ITask&, const TaskContext&)>;

/**
 * @brief Everything needed to build a generic task.
 *
 * Without callbacks, get_status reports `initial_state` and process reports
 * Ready. Either way the outputs carry "id" (the key) and "processed"
 * ("true"/"false") unless the callback already set them.
 */
struct TaskDefinition {
    std::string type = "test";
    std::string name;
    std::vector<TaskPtr> dependencies;
    std::vector<TaskPtr> status_dependencies;
    bool force = false;
    std::string input_version;
    std::optional<size_t> concurrency_limit;
    ActionState initial_state = ActionState::NotReady;
    TaskCallback get_status;
    TaskCallback process;
};

/// Construct a generic task. Dependencies are fixed at construction.
[[nodiscard]] TaskPtr make_task(TaskDefinition definition);

}  // namespace graph_solver
