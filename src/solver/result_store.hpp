/**
 * @file result_store.hpp
 * @brief Write-once, per-run map from task key to GraphResult.
 *
 * Not internally synchronized: the solver owns the store and only touches it
 * from its bookkeeping path, under its own mutex.
 */

#pragma once

#include "core/result.hpp"
#include "graph/graph_result.hpp"

#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace graph_solver {

class ResultStore {
public:
    ResultStore() = default;

    /// Record a terminal result. A second put for the same key is rejected.
    Result<void> put(std::shared_ptr<const GraphResult> result);

    [[nodiscard]] std::shared_ptr<const GraphResult> get(const TaskKey& key) const;
    [[nodiscard]] bool contains(const TaskKey& key) const;
    [[nodiscard]] GraphResults get_all() const;

    /// Sub-map restricted to @p keys; absent keys are skipped.
    [[nodiscard]] GraphResults pick(const std::vector<TaskKey>& keys) const;

    /// Earliest-recorded error among @p keys, by insertion order.
    [[nodiscard]] std::optional<Error> first_error(const std::set<TaskKey>& keys) const;

    /// Keys in the order their results were recorded.
    [[nodiscard]] const std::vector<TaskKey>& completion_order() const noexcept { return order_; }

    [[nodiscard]] size_t size() const noexcept { return results_.size(); }
    [[nodiscard]] bool empty() const noexcept { return results_.empty(); }

private:
    GraphResults results_;
    std::vector<TaskKey> order_;
};

}  // namespace graph_solver
