/**
 * @file event_recorder.hpp
 * @brief Solver observer that records task and batch events as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "solver/observer.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace graph_solver {

/// Running totals per event type.
struct EventCounts {
    size_t batches_started = 0;
    size_t batches_settled = 0;
    size_t pending = 0;
    size_t processing = 0;
    size_t complete = 0;
    size_t errors = 0;
    size_t cancelled = 0;
};

/**
 * @brief Writes one JSON object per event:
 * batchStarted, taskPending, taskProcessing, taskComplete, taskError,
 * taskCancelled, batchSettled.
 */
class EventRecorder : public ISolverObserver {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink);

    void on_batch_started(const BatchId& batch, const std::vector<TaskKey>& roots) override;
    void on_task_pending(const TaskKey& key, const BatchId& batch) override;
    void on_task_processing(const TaskKey& key, TaskOperation op) override;
    void on_task_result(const GraphResult& result) override;
    void on_batch_settled(const BatchId& batch, bool cancelled) override;

    [[nodiscard]] EventCounts counts() const;
    void flush();

private:
    void emit(std::string_view event, const std::string& fields);

    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    EventCounts counts_;
};

}  // namespace graph_solver
