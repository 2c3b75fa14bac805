/**
 * @file observer.hpp
 * @brief Read-only view of the solver's result stream and batch transitions.
 *
 * Callbacks are invoked from the solver's bookkeeping path while its lock is
 * held; implementations must be quick and must not call back into the solver.
 */

#pragma once

#include "core/types.hpp"
#include "graph/graph_result.hpp"

#include <string_view>
#include <vector>

namespace graph_solver {

/// Which task operation is being started.
enum class TaskOperation : uint8_t {
    Status,
    Process
};

[[nodiscard]] constexpr std::string_view to_string(TaskOperation op) noexcept {
    switch (op) {
        case TaskOperation::Status:  return "status";
        case TaskOperation::Process: return "process";
    }
    return "unknown";
}

class ISolverObserver {
public:
    virtual ~ISolverObserver() = default;

    virtual void on_batch_started(const BatchId& /*batch*/, const std::vector<TaskKey>& /*roots*/) {}
    virtual void on_task_pending(const TaskKey& /*key*/, const BatchId& /*batch*/) {}
    virtual void on_task_processing(const TaskKey& /*key*/, TaskOperation /*op*/) {}
    /// Terminal result: complete, error or cancelled.
    virtual void on_task_result(const GraphResult& /*result*/) {}
    virtual void on_batch_settled(const BatchId& /*batch*/, bool /*cancelled*/) {}
};

}  // namespace graph_solver
