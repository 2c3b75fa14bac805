/**
 * @file batch_tracker.cpp
 * @brief BatchTracker implementation.
 */

#include "solver/batch_tracker.hpp"

#include <algorithm>

namespace graph_solver {

BatchId BatchTracker::start_batch(std::vector<TaskKey> roots) {
    BatchId id = "batch-" + std::to_string(next_id_++);
    BatchInfo info;
    info.id = id;
    info.roots = std::move(roots);
    batches_.emplace(id, std::move(info));
    return id;
}

bool BatchTracker::attach(const BatchId& id, const TaskKey& key, bool terminal) {
    auto it = batches_.find(id);
    if (it == batches_.end() || it->second.status != BatchStatus::Active) return false;

    auto& batch = it->second;
    if (std::find(batch.keys.begin(), batch.keys.end(), key) != batch.keys.end()) {
        return false;
    }
    batch.keys.push_back(key);
    if (!terminal) {
        batch.pending.insert(key);
        holders_[key].insert(id);
    }
    return true;
}

std::vector<BatchId> BatchTracker::on_key_terminal(const TaskKey& key) {
    std::vector<BatchId> settled;

    auto it = holders_.find(key);
    if (it == holders_.end()) return settled;

    for (const auto& id : it->second) {
        auto& batch = batches_.at(id);
        batch.pending.erase(key);
        if (batch.status == BatchStatus::Active && batch.pending.empty()) {
            batch.status = BatchStatus::Settled;
            settled.push_back(id);
        }
    }
    holders_.erase(it);
    return settled;
}

bool BatchTracker::try_settle(const BatchId& id) {
    auto it = batches_.find(id);
    if (it == batches_.end()) return false;
    auto& batch = it->second;
    if (batch.status != BatchStatus::Active || !batch.pending.empty()) return false;
    batch.status = BatchStatus::Settled;
    return true;
}

std::vector<TaskKey> BatchTracker::release(const BatchId& id, Error reason) {
    std::vector<TaskKey> orphaned;

    auto it = batches_.find(id);
    if (it == batches_.end() || it->second.status != BatchStatus::Active) return orphaned;

    auto& batch = it->second;
    batch.status = BatchStatus::Cancelled;
    batch.error = std::move(reason);

    for (const auto& key : batch.pending) {
        auto holder_it = holders_.find(key);
        if (holder_it == holders_.end()) continue;
        holder_it->second.erase(id);
        if (holder_it->second.empty()) {
            holders_.erase(holder_it);
            orphaned.push_back(key);
        }
    }
    batch.pending.clear();
    return orphaned;
}

const BatchInfo* BatchTracker::find(const BatchId& id) const {
    auto it = batches_.find(id);
    return it == batches_.end() ? nullptr : &it->second;
}

bool BatchTracker::is_settled(const BatchId& id) const {
    const auto* batch = find(id);
    return batch != nullptr && batch->status != BatchStatus::Active;
}

std::set<BatchId> BatchTracker::holders(const TaskKey& key) const {
    auto it = holders_.find(key);
    if (it == holders_.end()) return {};
    return it->second;
}

size_t BatchTracker::active_count() const {
    return static_cast<size_t>(std::count_if(batches_.begin(), batches_.end(), [](const auto& entry) {
        return entry.second.status == BatchStatus::Active;
    }));
}

}  // namespace graph_solver
