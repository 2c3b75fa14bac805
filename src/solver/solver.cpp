/**
 * @file solver.cpp
 * @brief Solver implementation: activation, gating, admission and cascades.
 *
 * Every private member function except run_operation() expects mutex_ to be
 * held. run_operation() executes on a pool worker without the lock and
 * re-enters the bookkeeping path through on_operation_finished().
 */

#include "solver/solver.hpp"

#include "core/errors.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <set>

namespace graph_solver {

namespace {

int64_t elapsed_ms(Timestamp since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - since).count();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Solver::Solver() : Solver(Options{}) {}

Solver::Solver(Options options)
    : config_(std::move(options.config))
    , logger_(std::move(options.logger))
    , observer_(std::move(options.observer)) {
    if (!logger_) {
        logger_ = std::make_shared<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
    }
    if (!observer_) {
        observer_ = std::make_shared<ISolverObserver>();
    }
    config_.concurrency_limit = std::max<uint32_t>(config_.concurrency_limit, 1);

    size_t threads = config_.thread_count > 0 ? config_.thread_count : config_.concurrency_limit;
    pool_ = std::make_unique<ThreadPool>(threads);
    deadline_watcher_ = std::jthread([this](std::stop_token stop) { watch_deadlines(stop); });
}

Solver::~Solver() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
        ready_.clear();
        for (auto& [key, node] : nodes_) {
            if (is_in_flight(node.get())) {
                node->stop.request_stop();
            }
        }
    }
    cv_.notify_all();
    deadline_watcher_.request_stop();
    if (deadline_watcher_.joinable()) {
        deadline_watcher_.join();
    }
    pool_.reset();
}

// ─────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────

Result<GraphResults> Solver::submit(const std::vector<TaskPtr>& tasks, SolveOptions opts) {
    auto id = start(tasks, opts.deadline);
    if (!id) {
        return id.error();
    }

    auto settled = wait_until_settled(*id);
    if (!settled && opts.throw_on_error) {
        return settled.error();
    }

    std::lock_guard lock(mutex_);
    const auto* batch = tracker_.find(*id);
    auto results = store_.pick(batch->keys);

    if (opts.throw_on_error) {
        std::set<TaskKey> keys(batch->keys.begin(), batch->keys.end());
        if (auto first = store_.first_error(keys)) {
            return *first;
        }
    }
    return results;
}

Result<BatchId> Solver::start(const std::vector<TaskPtr>& tasks, std::optional<SteadyTime> deadline) {
    std::lock_guard lock(mutex_);

    if (shutting_down_) {
        return Error{ErrorKind::Graph, "Solver is shutting down"};
    }

    auto resolved = resolver_.resolve(tasks);
    if (!resolved) {
        logger_->error("Rejected submission: " + describe(resolved.error()));
        return resolved.error();
    }
    intern(*resolved);

    std::vector<TaskKey> root_keys;
    for (size_t idx : resolved->roots()) {
        root_keys.push_back(resolved->nodes()[idx].key);
    }

    auto id = tracker_.start_batch(root_keys);
    if (deadline) {
        deadlines_[id] = *deadline;
    } else if (config_.deadline_ms > 0) {
        deadlines_[id] = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.deadline_ms);
    }

    observer_->on_batch_started(id, root_keys);
    logger_->info("Started " + id + " with " + std::to_string(root_keys.size()) + " root task(s)");

    // Attach every root before activating any, so an immediate cascade
    // cannot settle the batch while roots are still unattached. Every new
    // root is pending before any is expanded, so a root's status check is
    // gated by the other roots it depends on regardless of their order.
    for (const auto& key : root_keys) {
        attach(node_for(key), id);
    }
    std::vector<Node*> fresh;
    for (const auto& key : root_keys) {
        Node* node = node_for(key);
        if (node->phase == Phase::Inactive) {
            mark_pending(node, id);
            fresh.push_back(node);
        }
    }
    for (Node* node : fresh) {
        expand(node);
    }

    if (tracker_.try_settle(id)) {
        deadlines_.erase(id);
        observer_->on_batch_settled(id, false);
        logger_->info(id + " settled");
    }

    dispatch();
    cv_.notify_all();
    return id;
}

Result<void> Solver::wait_until_settled(const BatchId& id) {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] {
        const auto* batch = tracker_.find(id);
        return !batch || batch->status != BatchStatus::Active;
    });

    const auto* batch = tracker_.find(id);
    if (!batch) {
        return Error{ErrorKind::Graph, "Unknown batch " + id};
    }
    if (batch->error) return *batch->error;
    return {};
}

Result<void> Solver::cancel(const BatchId& id) {
    std::lock_guard lock(mutex_);
    return cancel_locked(id, cancelled_error(id));
}

Result<GraphResults> Solver::batch_results(const BatchId& id) const {
    std::lock_guard lock(mutex_);
    const auto* batch = tracker_.find(id);
    if (!batch) {
        return Error{ErrorKind::Graph, "Unknown batch " + id};
    }
    return store_.pick(batch->keys);
}

GraphResults Solver::results() const {
    std::lock_guard lock(mutex_);
    return store_.get_all();
}

std::optional<NodeState> Solver::state_of(const TaskKey& key) const {
    std::lock_guard lock(mutex_);
    const auto* node = node_for(key);
    if (!node || node->phase == Phase::Inactive) return std::nullopt;
    return node->state;
}

std::optional<BatchStatus> Solver::batch_status(const BatchId& id) const {
    std::lock_guard lock(mutex_);
    const auto* batch = tracker_.find(id);
    if (!batch) return std::nullopt;
    return batch->status;
}

size_t Solver::in_progress_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(nodes_.begin(), nodes_.end(), [](const auto& entry) {
        return is_active(entry.second.get());
    }));
}

size_t Solver::running_count() const {
    std::lock_guard lock(mutex_);
    return running_;
}

// ─────────────────────────────────────────────
// Graph registration
// ─────────────────────────────────────────────

void Solver::intern(const ResolvedGraph& graph) {
    const auto& resolved = graph.nodes();
    std::vector<size_t> added;

    for (size_t i = 0; i < resolved.size(); ++i) {
        const auto& rn = resolved[i];
        if (nodes_.contains(rn.key)) continue;

        auto node = std::make_unique<Node>();
        node->task = rn.task;
        node->key = rn.key;
        node->type = rn.task->type();
        node->seq = next_seq_++;

        std::optional<size_t> limit = rn.task->concurrency_limit();
        if (auto it = config_.type_limits.find(node->type); it != config_.type_limits.end()) {
            size_t configured = it->second;
            limit = limit ? std::min(*limit, configured) : configured;
        }
        if (limit && *limit == 0) limit = 1;
        node->type_limit = limit;

        nodes_.emplace(rn.key, std::move(node));
        added.push_back(i);
    }

    // Only new nodes are wired; known keys keep their first-seen edges
    for (size_t i : added) {
        const auto& rn = resolved[i];
        Node* node = node_for(rn.key);
        for (size_t dep : rn.dependencies) {
            Node* target = node_for(resolved[dep].key);
            node->dependencies.push_back(target);
            target->dependents.push_back(node);
        }
        for (size_t dep : rn.status_dependencies) {
            Node* target = node_for(resolved[dep].key);
            node->status_dependencies.push_back(target);
            target->status_dependents.push_back(node);
        }
    }
}

Solver::Node* Solver::node_for(const TaskKey& key) const {
    auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : it->second.get();
}

// ─────────────────────────────────────────────
// Activation and batch references
// ─────────────────────────────────────────────

void Solver::attach(Node* node, const BatchId& batch) {
    const bool terminal = node->phase == Phase::Terminal;
    if (!tracker_.attach(batch, node->key, terminal)) return;
    if (terminal || node->phase == Phase::Inactive) return;

    // Follow whatever the node is already waiting on
    for (Node* dep : node->status_dependencies) {
        if (dep->phase != Phase::Inactive) attach(dep, batch);
    }
    for (Node* dep : node->dependencies) {
        if (dep->phase != Phase::Inactive) attach(dep, batch);
    }
}

void Solver::share_holders(const Node* from, Node* to) {
    for (const auto& batch : tracker_.holders(from->key)) {
        attach(to, batch);
    }
}

void Solver::activate(Node* node, const BatchId& batch) {
    if (node->phase != Phase::Inactive) return;
    mark_pending(node, batch);
    expand(node);
}

void Solver::mark_pending(Node* node, const BatchId& batch) {
    node->phase = Phase::WaitingStatus;
    node->state = NodeState::Pending;
    node->origin = batch;
    observer_->on_task_pending(node->key, batch);
    logger_->debug("Activated " + node->key + " in " + batch);
}

void Solver::expand(Node* node) {
    if (node->phase != Phase::WaitingStatus) return;

    if (node->task->force()) {
        request_processing(node);
        return;
    }

    for (Node* dep : node->status_dependencies) {
        share_holders(node, dep);
        activate(dep, node->origin);
        if (node->phase == Phase::Terminal) return;
    }
    advance(node);
}

void Solver::request_processing(Node* node) {
    node->phase = Phase::WaitingDependencies;
    node->state = NodeState::Pending;
    node->status_known = true;

    for (Node* dep : node->dependencies) {
        share_holders(node, dep);
        activate(dep, node->origin);
        if (node->phase == Phase::Terminal) return;
    }

    // The status is known now; status dependents need not wait for processing
    release_status_dependents(node);
    if (node->phase == Phase::WaitingDependencies) advance(node);
}

// ─────────────────────────────────────────────
// State machine
// ─────────────────────────────────────────────

void Solver::advance(Node* node) {
    bool waiting = false;

    switch (node->phase) {
        case Phase::WaitingStatus:
            // Forced nodes never check status; expand() routes them straight on
            if (node->task->force()) break;
            for (Node* dep : node->dependencies) {
                if (dep->phase == Phase::Inactive) continue;
                if (dep->phase == Phase::Terminal) {
                    if (dep->state != NodeState::Done) {
                        cascade(node, dep);
                        return;
                    }
                } else {
                    share_holders(node, dep);
                    waiting = true;
                }
            }
            for (Node* dep : node->status_dependencies) {
                if (!status_resolved(dep)) waiting = true;
            }
            if (!waiting) enqueue(node, Phase::StatusQueued);
            break;

        case Phase::WaitingDependencies:
            for (Node* dep : node->dependencies) {
                if (dep->phase == Phase::Terminal) {
                    if (dep->state != NodeState::Done) {
                        cascade(node, dep);
                        return;
                    }
                } else {
                    waiting = true;
                }
            }
            if (!waiting) enqueue(node, Phase::ProcessQueued);
            break;

        default:
            break;
    }
}

void Solver::enqueue(Node* node, Phase queued) {
    node->phase = queued;
    ready_.emplace(node->seq, node);
}

void Solver::dispatch() {
    if (shutting_down_) return;

    const size_t limit = config_.concurrency_limit;
    while (true) {
        for (auto it = ready_.begin(); it != ready_.end() && running_ < limit;) {
            Node* node = it->second;
            if (node->type_limit && running_by_type_[node->type] >= *node->type_limit) {
                ++it;
                continue;
            }
            it = ready_.erase(it);
            launch(node);
        }
        if (running_ > 0 || !ready_.empty()) return;

        // Nothing can finish, so no waiting node would ever be woken
        Node* stalled = stalled_status_check();
        if (!stalled) return;
        logger_->debug("Status wait loop; checking " + stalled->key + " first");
        enqueue(stalled, Phase::StatusQueued);
    }
}

Solver::Node* Solver::stalled_status_check() const {
    // Prefer a node held back only by process dependencies, then the oldest
    Node* best = nullptr;
    bool best_clear = false;
    for (const auto& [key, owned] : nodes_) {
        Node* node = owned.get();
        if (node->phase != Phase::WaitingStatus) continue;
        const bool clear = std::all_of(node->status_dependencies.begin(), node->status_dependencies.end(),
                                       [](const Node* dep) { return status_resolved(dep); });
        if (!best || (clear && !best_clear) || (clear == best_clear && node->seq < best->seq)) {
            best = node;
            best_clear = clear;
        }
    }
    return best;
}

void Solver::launch(Node* node) {
    const auto op = node->phase == Phase::StatusQueued ? TaskOperation::Status : TaskOperation::Process;
    if (op == TaskOperation::Status) {
        node->phase = Phase::StatusChecking;
        node->state = NodeState::StatusChecking;
    } else {
        node->phase = Phase::Processing;
        node->state = NodeState::Processing;
    }

    ++running_;
    ++running_by_type_[node->type];

    node->context_results = context_for(node, op);
    TaskContext ctx{node->context_results, node->stop.get_token(), node->origin};

    observer_->on_task_processing(node->key, op);
    logger_->debug("Starting " + std::string{to_string(op)} + " for " + node->key);

    const Timestamp started = std::chrono::system_clock::now();
    pool_->post([this, node, op, ctx = std::move(ctx), started](std::stop_token) mutable {
        run_operation(node, op, std::move(ctx), started);
    });
}

void Solver::run_operation(Node* node, TaskOperation op, TaskContext ctx, Timestamp started) {
    // node->task and node->key never change after registration
    auto outcome = [&]() -> Result<TaskOutcome> {
        if (ctx.stop_requested()) {
            return Error{ErrorKind::Cancelled, node->key + " was cancelled before " + std::string{to_string(op)}};
        }
        try {
            return op == TaskOperation::Status ? node->task->get_status(ctx) : node->task->process(ctx);
        } catch (const std::exception& ex) {
            return crash_error(node->key, to_string(op), ex);
        } catch (...) {
            return crash_error(node->key, to_string(op), "unknown exception");
        }
    }();

    on_operation_finished(node, op, std::move(outcome), started);
}

void Solver::on_operation_finished(Node* node, TaskOperation op, Result<TaskOutcome> outcome, Timestamp started) {
    std::lock_guard lock(mutex_);

    --running_;
    if (auto it = running_by_type_.find(node->type); it != running_by_type_.end() && it->second > 0) {
        --it->second;
    }

    if (node->phase == Phase::Terminal) {
        logger_->debug("Discarding late " + std::string{to_string(op)} + " outcome for cancelled " + node->key);
    } else if (!outcome) {
        fail(node, std::move(outcome.error()), started);
    } else if (op == TaskOperation::Status) {
        if (outcome->state == ActionState::Ready) {
            complete(node, std::move(*outcome), false, started);
        } else {
            auto snapshot = base_result(node);
            snapshot->outcome = NodeState::Pending;
            snapshot->state = outcome->state;
            snapshot->outputs = std::move(outcome->outputs);
            snapshot->started_at = started;
            snapshot->completed_at = std::chrono::system_clock::now();
            node->status_result = std::move(snapshot);
            request_processing(node);
        }
    } else if (outcome->state == ActionState::Failed) {
        Error err{ErrorKind::Task, node->key + " reported state failed"};
        err.type = "task";
        err.keys = {node->key};
        fail(node, std::move(err), started);
    } else {
        complete(node, std::move(*outcome), true, started);
    }

    dispatch();
    cv_.notify_all();
}

// ─────────────────────────────────────────────
// Terminal transitions
// ─────────────────────────────────────────────

std::shared_ptr<GraphResult> Solver::base_result(const Node* node) const {
    auto result = std::make_shared<GraphResult>();
    result->key = node->key;
    result->type = node->type;
    result->name = node->task->name();
    result->description = node->task->description();
    result->input_version = node->task->input_version();
    return result;
}

GraphResults Solver::context_for(const Node* node, TaskOperation /*op*/) const {
    // Status checks see only the dependencies already done; process sees all
    // of them. A status dependency still processing contributes its status
    // result. Failed status dependencies are left out either way.
    GraphResults out;
    for (const Node* dep : node->dependencies) {
        if (auto result = store_.get(dep->key); result && result->succeeded()) {
            out.emplace(dep->key, std::move(result));
        }
    }
    for (const Node* dep : node->status_dependencies) {
        if (auto result = store_.get(dep->key)) {
            if (result->succeeded()) out.emplace(dep->key, std::move(result));
        } else if (dep->status_result) {
            out.emplace(dep->key, dep->status_result);
        }
    }
    return out;
}

void Solver::complete(Node* node, TaskOutcome outcome, bool processed, Timestamp started) {
    auto result = base_result(node);
    result->outcome = NodeState::Done;
    result->state = outcome.state;
    result->processed = processed;
    result->outputs = std::move(outcome.outputs);
    result->started_at = started;
    result->dependency_results = node->context_results;

    if (processed) {
        logger_->info("Processed " + node->key + " in " + std::to_string(elapsed_ms(started)) + "ms");
    } else {
        logger_->debug(node->key + " is ready, skipping processing");
    }
    finalize(node, std::move(result));
}

void Solver::fail(Node* node, Error error, Timestamp started) {
    logger_->error("Failed " + node->key + ": " + describe(error));

    auto result = base_result(node);
    result->outcome = NodeState::Failed;
    result->state = ActionState::Failed;
    result->error = std::move(error);
    result->started_at = started;
    result->dependency_results = node->context_results;
    finalize(node, std::move(result));
}

void Solver::cascade(Node* node, const Node* failed_dependency) {
    auto dep_result = store_.get(failed_dependency->key);
    Error reason = dep_result && dep_result->error
        ? cascade_error(failed_dependency->key, *dep_result->error)
        : Error{ErrorKind::Cascade, "Dependency " + failed_dependency->key + " did not complete"};

    GraphResults consumed;
    if (dep_result) consumed.emplace(failed_dependency->key, dep_result);
    cancel_node(node, reason, std::move(consumed));
}

void Solver::cancel_node(Node* node, const Error& reason, GraphResults dependency_results, bool propagate) {
    if (node->phase == Phase::Terminal) return;

    if (is_in_flight(node)) {
        node->stop.request_stop();
    }
    ready_.erase(node->seq);

    logger_->warn("Cancelled " + node->key + ": " + reason.message);

    auto result = base_result(node);
    result->outcome = NodeState::Cancelled;
    result->error = reason;
    result->dependency_results = std::move(dependency_results);
    finalize(node, std::move(result), propagate);
}

void Solver::finalize(Node* node, std::shared_ptr<GraphResult> result, bool propagate) {
    result->completed_at = std::chrono::system_clock::now();
    node->phase = Phase::Terminal;
    node->state = result->outcome;
    node->context_results.clear();

    if (auto stored = store_.put(result); !stored) {
        logger_->error(stored.error().message);
    }
    observer_->on_task_result(*result);

    for (const auto& batch : tracker_.on_key_terminal(node->key)) {
        deadlines_.erase(batch);
        observer_->on_batch_settled(batch, false);
        logger_->info(batch + " settled");
    }

    if (propagate) release_dependents(node);
}

void Solver::release_dependents(Node* node) {
    for (Node* dependent : node->dependents) {
        if (is_active(dependent)) advance(dependent);
    }
    release_status_dependents(node);
}

void Solver::release_status_dependents(Node* node) {
    for (Node* dependent : node->status_dependents) {
        if (is_active(dependent)) advance(dependent);
    }
}

Result<void> Solver::cancel_locked(const BatchId& id, Error reason) {
    const auto* batch = tracker_.find(id);
    if (!batch) {
        return Error{ErrorKind::Graph, "Unknown batch " + id};
    }
    if (batch->status != BatchStatus::Active) {
        return {};
    }

    auto orphaned = tracker_.release(id, reason);
    std::vector<Node*> victims;
    for (const auto& key : orphaned) {
        if (Node* node = node_for(key)) victims.push_back(node);
    }
    std::sort(victims.begin(), victims.end(), [](const Node* a, const Node* b) { return a->seq < b->seq; });

    // Every orphan records the batch's reason before any dependent is woken
    for (Node* node : victims) {
        cancel_node(node, reason, {}, false);
    }
    for (Node* node : victims) {
        release_dependents(node);
    }

    deadlines_.erase(id);
    observer_->on_batch_settled(id, true);
    logger_->warn(id + " cancelled: " + reason.message);

    dispatch();
    cv_.notify_all();
    return {};
}

// ─────────────────────────────────────────────
// Deadlines
// ─────────────────────────────────────────────

void Solver::watch_deadlines(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (deadlines_.empty()) {
            cv_.wait(lock, stop, [this] { return !deadlines_.empty(); });
            continue;
        }

        auto earliest = [this] {
            return std::min_element(deadlines_.begin(), deadlines_.end(),
                [](const auto& a, const auto& b) { return a.second < b.second; })->second;
        };
        const SteadyTime next = earliest();
        // Wake early when the set of deadlines changes
        cv_.wait_until(lock, stop, next, [&] { return deadlines_.empty() || earliest() != next; });
        if (stop.stop_requested()) break;
        expire_deadlines();
    }
}

void Solver::expire_deadlines() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<BatchId> expired;
    for (const auto& [id, deadline] : deadlines_) {
        if (deadline <= now) expired.push_back(id);
    }

    for (const auto& id : expired) {
        logger_->warn("Deadline exceeded for " + id);
        if (auto cancelled = cancel_locked(id, deadline_error(id)); !cancelled) {
            logger_->error(cancelled.error().message);
        }
        deadlines_.erase(id);
    }
}

}  // namespace graph_solver
