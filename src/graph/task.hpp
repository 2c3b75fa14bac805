/**
 * @file task.hpp
 * @brief Task capability interface consumed by the resolver and the solver.
 *
 * Concrete variants (generic callback tasks, build/deploy/run/test actions)
 * are constructed through factory functions; the solver only depends on ITask.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/graph_result.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace graph_solver {

class ITask;
using TaskPtr = std::shared_ptr<ITask>;

/**
 * @brief What getStatus/process report back on success.
 */
struct TaskOutcome {
    ActionState state = ActionState::Unknown;
    Outputs outputs;
};

/**
 * @brief Per-call context handed to getStatus/process.
 *
 * The dependency results are restricted to the task's own declared
 * dependencies and must be treated as read-only.
 */
class TaskContext {
public:
    TaskContext(GraphResults dependency_results, std::stop_token stop, BatchId batch_id)
        : dependency_results_(std::move(dependency_results))
        , stop_(std::move(stop))
        , batch_id_(std::move(batch_id)) {}

    [[nodiscard]] const GraphResults& dependency_results() const noexcept { return dependency_results_; }

    [[nodiscard]] std::shared_ptr<const GraphResult> dependency_result(const TaskKey& key) const {
        return find_result(dependency_results_, key);
    }

    [[nodiscard]] std::shared_ptr<const GraphResult> dependency_result(const ITask& task) const;

    /// Cooperative cancellation; long-running bodies should poll this.
    [[nodiscard]] std::stop_token stop_token() const noexcept { return stop_; }
    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }

    /// Batch that first activated the task.
    [[nodiscard]] const BatchId& batch_id() const noexcept { return batch_id_; }

private:
    GraphResults dependency_results_;
    std::stop_token stop_;
    BatchId batch_id_;
};

/**
 * @brief Abstract interface for a unit of work (runtime polymorphism).
 *
 * getStatus and process are the only suspension points: they run on executor
 * workers and may block on I/O. A domain failure is reported by returning an
 * Error; any exception that escapes is treated as a crash.
 */
class ITask {
public:
    virtual ~ITask() = default;

    /// Stable identity "<type>.<name>", used for deduplication and caching.
    [[nodiscard]] virtual TaskKey key() const = 0;
    [[nodiscard]] virtual std::string type() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string description() const { return key(); }

    /// Tasks that must be done before process() may run.
    [[nodiscard]] virtual std::vector<TaskPtr> dependencies() const = 0;
    /// Tasks that must be resolved before get_status() may run.
    [[nodiscard]] virtual std::vector<TaskPtr> status_dependencies() const = 0;

    [[nodiscard]] virtual bool force() const noexcept = 0;
    [[nodiscard]] virtual std::string input_version() const = 0;

    /// Optional bound on concurrently running tasks of this type.
    [[nodiscard]] virtual std::optional<size_t> concurrency_limit() const noexcept { return std::nullopt; }

    virtual Result<TaskOutcome> get_status(const TaskContext& ctx) = 0;
    virtual Result<TaskOutcome> process(const TaskContext& ctx) = 0;
};

inline std::shared_ptr<const GraphResult> TaskContext::dependency_result(const ITask& task) const {
    return dependency_result(task.key());
}

/// Build a key from its parts.
[[nodiscard]] inline TaskKey make_key(const std::string& type, const std::string& name) {
    return type + "." + name;
}

}  // namespace graph_solver
