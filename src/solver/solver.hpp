/**
 * @file solver.hpp
 * @brief Concurrency-bounded dependency scheduler.
 *
 * A Solver instance is one run: it owns the Result Store, the per-key
 * in-flight state, the batch tracker and the worker pool. Batches submitted
 * to the same instance share nodes by key, so every key is checked and
 * processed at most once per run.
 *
 * Scheduling model:
 *   - Submitting roots activates them and, transitively, their status
 *     dependencies. Process dependencies are activated only once a node
 *     needs processing (status not ready, or force).
 *   - A status check waits for every status dependency to have a known
 *     status, and for every active process dependency to be terminal.
 *     If nothing is running and nothing is queued, the oldest waiting
 *     status check is admitted anyway, which breaks waits that loop
 *     through status dependencies.
 *   - process() waits for every process dependency to be done. A failed or
 *     cancelled process dependency cascades to the dependent.
 *   - Admission is bounded globally and per task type; eligible nodes are
 *     admitted in registration order.
 *
 * All bookkeeping runs under one mutex. Task bodies run on pool workers
 * with the lock released. A watcher thread cancels batches whose deadline
 * has passed, whether or not anyone is waiting on them.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "graph/graph_result.hpp"
#include "graph/resolver.hpp"
#include "graph/task.hpp"
#include "solver/batch_tracker.hpp"
#include "solver/observer.hpp"
#include "solver/result_store.hpp"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace graph_solver {

struct SolveOptions {
    bool throw_on_error = false;            ///< Return the first error instead of the results
    std::optional<SteadyTime> deadline;     ///< Cancel the batch when this passes
};

class Solver {
public:
    struct Options {
        SolverConfig config;
        std::shared_ptr<Logger> logger;                 ///< nullptr = discard
        std::shared_ptr<ISolverObserver> observer;      ///< optional
    };

    Solver();
    explicit Solver(Options options);
    ~Solver();

    Solver(const Solver&) = delete;
    Solver& operator=(const Solver&) = delete;

    /**
     * @brief Run @p tasks and their closure to completion.
     *
     * Cycles and invalid task definitions are returned before anything runs.
     * Otherwise the batch's results are returned, or, with throw_on_error,
     * the earliest-recorded error among them once the batch has settled.
     */
    Result<GraphResults> submit(const std::vector<TaskPtr>& tasks, SolveOptions opts = {});

    /// Start a batch without waiting for it.
    Result<BatchId> start(const std::vector<TaskPtr>& tasks, std::optional<SteadyTime> deadline = std::nullopt);

    /**
     * @brief Block until the batch has settled.
     *
     * Returns the cancellation (or deadline) error if the batch did not
     * settle normally.
     */
    Result<void> wait_until_settled(const BatchId& id);

    /// Cancel a batch. Nodes still held by other active batches keep running.
    Result<void> cancel(const BatchId& id);

    /// Results of every key the batch attached to that has a result.
    [[nodiscard]] Result<GraphResults> batch_results(const BatchId& id) const;

    [[nodiscard]] GraphResults results() const;
    [[nodiscard]] std::optional<NodeState> state_of(const TaskKey& key) const;
    [[nodiscard]] std::optional<BatchStatus> batch_status(const BatchId& id) const;

    /// Activated nodes that are not terminal yet.
    [[nodiscard]] size_t in_progress_count() const;
    /// Nodes in statusChecking or processing.
    [[nodiscard]] size_t running_count() const;

    [[nodiscard]] const SolverConfig& config() const noexcept { return config_; }

private:
    enum class Phase : uint8_t {
        Inactive,
        WaitingStatus,
        StatusQueued,
        StatusChecking,
        WaitingDependencies,
        ProcessQueued,
        Processing,
        Terminal
    };

    struct Node {
        TaskPtr task;
        TaskKey key;
        std::string type;
        size_t seq = 0;
        std::optional<size_t> type_limit;

        std::vector<Node*> dependencies;
        std::vector<Node*> status_dependencies;
        std::vector<Node*> dependents;
        std::vector<Node*> status_dependents;

        Phase phase = Phase::Inactive;
        NodeState state = NodeState::Pending;
        bool status_known = false;                  ///< Status checked, or skipped by force
        std::shared_ptr<const GraphResult> status_result;  ///< Not-ready status while processing
        BatchId origin;
        std::stop_source stop;
        GraphResults context_results;
    };

    // ── Graph registration ────────────────────
    void intern(const ResolvedGraph& graph);
    Node* node_for(const TaskKey& key) const;

    // ── Activation and batch references ───────
    void attach(Node* node, const BatchId& batch);
    void share_holders(const Node* from, Node* to);
    void activate(Node* node, const BatchId& batch);
    void mark_pending(Node* node, const BatchId& batch);
    void expand(Node* node);
    void request_processing(Node* node);

    // ── State machine ─────────────────────────
    void advance(Node* node);
    void enqueue(Node* node, Phase queued);
    void dispatch();
    Node* stalled_status_check() const;
    void launch(Node* node);
    void run_operation(Node* node, TaskOperation op, TaskContext ctx, Timestamp started);
    void on_operation_finished(Node* node, TaskOperation op, Result<TaskOutcome> outcome, Timestamp started);

    // ── Terminal transitions ──────────────────
    void complete(Node* node, TaskOutcome outcome, bool processed, Timestamp started);
    void fail(Node* node, Error error, Timestamp started);
    void cascade(Node* node, const Node* failed_dependency);
    void cancel_node(Node* node, const Error& reason, GraphResults dependency_results = {},
                     bool propagate = true);
    void finalize(Node* node, std::shared_ptr<GraphResult> result, bool propagate = true);
    void release_dependents(Node* node);
    void release_status_dependents(Node* node);

    Result<void> cancel_locked(const BatchId& id, Error reason);
    void watch_deadlines(std::stop_token stop);
    void expire_deadlines();
    GraphResults context_for(const Node* node, TaskOperation op) const;
    std::shared_ptr<GraphResult> base_result(const Node* node) const;

    [[nodiscard]] static bool is_active(const Node* node) noexcept {
        return node->phase != Phase::Inactive && node->phase != Phase::Terminal;
    }
    [[nodiscard]] static bool status_resolved(const Node* node) noexcept {
        return node->phase == Phase::Terminal || node->status_known;
    }
    [[nodiscard]] static bool is_in_flight(const Node* node) noexcept {
        return node->phase == Phase::StatusChecking || node->phase == Phase::Processing;
    }

    SolverConfig config_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<ISolverObserver> observer_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;

    DependencyResolver resolver_;
    ResultStore store_;
    BatchTracker tracker_;

    std::unordered_map<TaskKey, std::unique_ptr<Node>> nodes_;
    std::map<size_t, Node*> ready_;                      ///< Keyed by registration seq
    std::map<BatchId, SteadyTime> deadlines_;
    std::unordered_map<std::string, size_t> running_by_type_;
    size_t running_ = 0;
    size_t next_seq_ = 0;
    bool shutting_down_ = false;

    // Declared last: destroyed first, so in-flight jobs never outlive the state above.
    std::unique_ptr<ThreadPool> pool_;
    std::jthread deadline_watcher_;
};

}  // namespace graph_solver
