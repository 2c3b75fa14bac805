/**
 * @file action_task.hpp
 * @brief Build/Deploy/Run/Test action tasks backed by pluggable handlers.
 *
 * Handlers compute an action's status and result; the solver never looks
 * inside them. StatusCache is a simple status backend a handler pair can
 * consult so that already-satisfied actions short-circuit on later runs.
 */

#pragma once

#include "graph/task.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace graph_solver {

enum class ActionKind : uint8_t {
    Build,
    Deploy,
    Run,
    Test
};

[[nodiscard]] constexpr std::string_view to_string(ActionKind kind) noexcept {
    switch (kind) {
        case ActionKind::Build:  return "build";
        case ActionKind::Deploy: return "deploy";
        case ActionKind::Run:    return "run";
        case ActionKind::Test:   return "test";
    }
    return "unknown";
}

/**
 * @brief What a handler sees for one invocation.
 */
struct ActionRequest {
    ActionKind kind;
    const std::string& name;
    const TaskKey& key;
    const TaskContext& context;
};

using ActionHandler = std::function<Result<TaskOutcome>(const ActionRequest&)>;

struct ActionHandlers {
    ActionHandler get_status;   ///< Missing handler reports Unknown
    ActionHandler process;      ///< Missing handler reports Ready
};

struct ActionTaskSpec {
    ActionKind kind = ActionKind::Build;
    std::string name;
    ActionHandlers handlers;
    std::vector<TaskPtr> dependencies;
    std::vector<TaskPtr> status_dependencies;
    bool force = false;
    std::string version;
    std::optional<size_t> concurrency_limit;
};

[[nodiscard]] TaskPtr make_action_task(ActionTaskSpec spec);

// ─────────────────────────────────────────────
// StatusCache
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe in-memory status backend keyed by action key.
 *
 * Records which keys were actually processed, so callers can tell cached
 * work from executed work.
 */
class StatusCache {
public:
    [[nodiscard]] std::optional<TaskOutcome> get(const TaskKey& key) const;
    void put(const TaskKey& key, TaskOutcome outcome);
    void erase(const TaskKey& key);

    void mark_processed(const TaskKey& key);
    [[nodiscard]] std::set<TaskKey> processed_keys() const;
    [[nodiscard]] std::set<TaskKey> cached_keys() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<TaskKey, TaskOutcome> entries_;
    std::set<TaskKey> processed_;
};

/**
 * @brief Handlers that read status from @p cache and, on process, run
 * @p work (if any) and store a Ready outcome.
 *
 * @p cache must outlive every task built with these handlers.
 */
[[nodiscard]] ActionHandlers cached_handlers(StatusCache& cache, ActionHandler work = {});

}  // namespace graph_solver
