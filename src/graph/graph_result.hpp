/**
 * @file graph_result.hpp
 * @brief Recorded outcome of one task within one run.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace graph_solver {

struct GraphResult;

/// Results keyed by task key. Entries are immutable once recorded.
using GraphResults = std::map<TaskKey, std::shared_ptr<const GraphResult>>;

/**
 * @brief Outcome of one task. Written once by the solver, read-only afterwards.
 */
struct GraphResult {
    TaskKey key;
    std::string type;
    std::string name;
    std::string description;

    NodeState outcome = NodeState::Done;        ///< Done, Failed or Cancelled; Pending for a status-only result
    ActionState state = ActionState::Unknown;    ///< As reported by the task
    bool processed = false;                      ///< false when short-circuited by status
    Outputs outputs;
    std::optional<Error> error;
    std::string input_version;

    std::optional<Timestamp> started_at;         ///< Absent for cancelled tasks
    Timestamp completed_at{};

    /// Results of the task's own declared dependencies that it consumed.
    GraphResults dependency_results;

    [[nodiscard]] bool succeeded() const noexcept { return outcome == NodeState::Done; }
    [[nodiscard]] bool aborted() const noexcept { return outcome == NodeState::Cancelled; }
};

/// Lookup helper returning nullptr when absent.
[[nodiscard]] inline std::shared_ptr<const GraphResult> find_result(const GraphResults& results,
                                                                    const TaskKey& key) {
    auto it = results.find(key);
    return it == results.end() ? nullptr : it->second;
}

}  // namespace graph_solver
