/**
 * @file batch_tracker.hpp
 * @brief Bookkeeping for batches of root tasks submitted together.
 *
 * A batch holds a reference on every non-terminal key it waits for. Keys
 * shared between batches stay alive as long as at least one active batch
 * still holds them; releasing a batch reports the keys nobody holds anymore.
 * Not internally synchronized: guarded by the solver's mutex.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace graph_solver {

enum class BatchStatus : uint8_t {
    Active,
    Settled,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::Active:    return "active";
        case BatchStatus::Settled:   return "settled";
        case BatchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct BatchInfo {
    BatchId id;
    std::vector<TaskKey> roots;
    BatchStatus status = BatchStatus::Active;
    std::vector<TaskKey> keys;          ///< Every key attached, in attach order
    std::set<TaskKey> pending;          ///< Attached keys not yet terminal
    std::optional<Error> error;         ///< Set when cancelled or past its deadline
};

class BatchTracker {
public:
    BatchTracker() = default;

    /// Register a batch over @p roots and return its id ("batch-<n>").
    BatchId start_batch(std::vector<TaskKey> roots);

    /**
     * @brief Attach @p key to an active batch.
     * @return true if the key was not attached to the batch before.
     */
    bool attach(const BatchId& id, const TaskKey& key, bool terminal);

    /// Mark @p key terminal everywhere; returns the batches that just settled.
    std::vector<BatchId> on_key_terminal(const TaskKey& key);

    /// Settle an active batch with nothing pending. Returns true if it settled.
    bool try_settle(const BatchId& id);

    /**
     * @brief Cancel an active batch and drop its references.
     * @return Keys the batch was waiting for that no other active batch holds.
     */
    std::vector<TaskKey> release(const BatchId& id, Error reason);

    [[nodiscard]] const BatchInfo* find(const BatchId& id) const;
    [[nodiscard]] bool is_settled(const BatchId& id) const;
    [[nodiscard]] std::set<BatchId> holders(const TaskKey& key) const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] size_t batch_count() const noexcept { return batches_.size(); }

private:
    std::map<BatchId, BatchInfo> batches_;
    std::unordered_map<TaskKey, std::set<BatchId>> holders_;
    uint64_t next_id_ = 1;
};

}  // namespace graph_solver
