/**
 * @file action_task.cpp
 * @brief ActionTask and StatusCache implementations.
 */

#include "graph/action_task.hpp"

namespace graph_solver {

namespace {

class ActionTask final : public ITask {
public:
    explicit ActionTask(ActionTaskSpec spec)
        : spec_(std::move(spec))
        , key_(make_key(std::string{to_string(spec_.kind)}, spec_.name)) {}

    TaskKey key() const override { return key_; }
    std::string type() const override { return std::string{to_string(spec_.kind)}; }
    std::string name() const override { return spec_.name; }
    std::string description() const override {
        return std::string{to_string(spec_.kind)} + " " + spec_.name;
    }

    std::vector<TaskPtr> dependencies() const override { return spec_.dependencies; }
    std::vector<TaskPtr> status_dependencies() const override { return spec_.status_dependencies; }

    bool force() const noexcept override { return spec_.force; }
    std::string input_version() const override { return spec_.version; }
    std::optional<size_t> concurrency_limit() const noexcept override { return spec_.concurrency_limit; }

    Result<TaskOutcome> get_status(const TaskContext& ctx) override {
        if (!spec_.handlers.get_status) {
            return TaskOutcome{ActionState::Unknown, {}};
        }
        return spec_.handlers.get_status(ActionRequest{spec_.kind, spec_.name, key_, ctx});
    }

    Result<TaskOutcome> process(const TaskContext& ctx) override {
        if (!spec_.handlers.process) {
            return TaskOutcome{ActionState::Ready, {}};
        }
        return spec_.handlers.process(ActionRequest{spec_.kind, spec_.name, key_, ctx});
    }

private:
    ActionTaskSpec spec_;
    TaskKey key_;
};

}  // anonymous namespace

TaskPtr make_action_task(ActionTaskSpec spec) {
    return std::make_shared<ActionTask>(std::move(spec));
}

// ── StatusCache ──────────────────────────────

std::optional<TaskOutcome> StatusCache::get(const TaskKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void StatusCache::put(const TaskKey& key, TaskOutcome outcome) {
    std::lock_guard lock(mutex_);
    entries_[key] = std::move(outcome);
}

void StatusCache::erase(const TaskKey& key) {
    std::lock_guard lock(mutex_);
    entries_.erase(key);
}

void StatusCache::mark_processed(const TaskKey& key) {
    std::lock_guard lock(mutex_);
    processed_.insert(key);
}

std::set<TaskKey> StatusCache::processed_keys() const {
    std::lock_guard lock(mutex_);
    return processed_;
}

std::set<TaskKey> StatusCache::cached_keys() const {
    std::lock_guard lock(mutex_);
    std::set<TaskKey> keys;
    for (const auto& [key, _] : entries_) {
        keys.insert(key);
    }
    return keys;
}

void StatusCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    processed_.clear();
}

ActionHandlers cached_handlers(StatusCache& cache, ActionHandler work) {
    ActionHandlers handlers;

    handlers.get_status = [&cache](const ActionRequest& req) -> Result<TaskOutcome> {
        if (auto cached = cache.get(req.key)) {
            return *cached;
        }
        return TaskOutcome{ActionState::Unknown, {}};
    };

    handlers.process = [&cache, work = std::move(work)](const ActionRequest& req) -> Result<TaskOutcome> {
        TaskOutcome outcome{ActionState::Ready, {}};
        if (work) {
            auto result = work(req);
            if (!result) return result;
            outcome = std::move(*result);
        }
        cache.mark_processed(req.key);
        if (outcome.state == ActionState::Ready) {
            cache.put(req.key, outcome);
        }
        return outcome;
    };

    return handlers;
}

}  // namespace graph_solver
