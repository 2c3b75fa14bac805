/**
 * @file result_store.cpp
 * @brief ResultStore implementation.
 */

#include "solver/result_store.hpp"

namespace graph_solver {

Result<void> ResultStore::put(std::shared_ptr<const GraphResult> result) {
    if (!result) {
        return Error{ErrorKind::Graph, "Cannot record a null result"};
    }
    auto key = result->key;
    auto [it, inserted] = results_.emplace(key, std::move(result));
    if (!inserted) {
        return Error{ErrorKind::Graph, "Result for " + key + " was already recorded"};
    }
    order_.push_back(std::move(key));
    return {};
}

std::shared_ptr<const GraphResult> ResultStore::get(const TaskKey& key) const {
    return find_result(results_, key);
}

bool ResultStore::contains(const TaskKey& key) const {
    return results_.contains(key);
}

GraphResults ResultStore::get_all() const {
    return results_;
}

GraphResults ResultStore::pick(const std::vector<TaskKey>& keys) const {
    GraphResults out;
    for (const auto& key : keys) {
        if (auto it = results_.find(key); it != results_.end()) {
            out.emplace(key, it->second);
        }
    }
    return out;
}

std::optional<Error> ResultStore::first_error(const std::set<TaskKey>& keys) const {
    for (const auto& key : order_) {
        if (!keys.contains(key)) continue;
        const auto& result = results_.at(key);
        if (result->error) {
            return *result->error;
        }
    }
    return std::nullopt;
}

}  // namespace graph_solver
