/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 */

#include "telemetry/event_recorder.hpp"

#include <chrono>
#include <sstream>

namespace graph_solver {

namespace {

std::string quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

int64_t epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

}  // anonymous namespace

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventRecorder::on_batch_started(const BatchId& batch, const std::vector<TaskKey>& roots) {
    std::ostringstream oss;
    oss << R"(,"batchId":)" << quoted(batch) << R"(,"roots":[)";
    for (size_t i = 0; i < roots.size(); ++i) {
        if (i > 0) oss << ",";
        oss << quoted(roots[i]);
    }
    oss << "]";

    std::lock_guard lock(write_mutex_);
    ++counts_.batches_started;
    emit("batchStarted", oss.str());
}

void EventRecorder::on_task_pending(const TaskKey& key, const BatchId& batch) {
    std::ostringstream oss;
    oss << R"(,"key":)" << quoted(key) << R"(,"batchId":)" << quoted(batch);

    std::lock_guard lock(write_mutex_);
    ++counts_.pending;
    emit("taskPending", oss.str());
}

void EventRecorder::on_task_processing(const TaskKey& key, TaskOperation op) {
    std::ostringstream oss;
    oss << R"(,"key":)" << quoted(key) << R"(,"operation":)" << quoted(to_string(op));

    std::lock_guard lock(write_mutex_);
    ++counts_.processing;
    emit("taskProcessing", oss.str());
}

void EventRecorder::on_task_result(const GraphResult& result) {
    std::ostringstream oss;
    oss << R"(,"key":)" << quoted(result.key)
        << R"(,"type":)" << quoted(result.type)
        << R"(,"inputVersion":)" << quoted(result.input_version);

    std::string_view event;
    switch (result.outcome) {
        case NodeState::Done:
            event = "taskComplete";
            oss << R"(,"state":)" << quoted(to_string(result.state))
                << R"(,"processed":)" << (result.processed ? "true" : "false");
            if (result.started_at) {
                oss << R"(,"durationMs":)" << (epoch_ms(result.completed_at) - epoch_ms(*result.started_at));
            }
            break;
        case NodeState::Failed:
            event = "taskError";
            break;
        default:
            event = "taskCancelled";
            break;
    }
    if (result.error) {
        oss << R"(,"errorKind":)" << quoted(to_string(result.error->kind))
            << R"(,"error":)" << quoted(result.error->message);
    }

    std::lock_guard lock(write_mutex_);
    switch (result.outcome) {
        case NodeState::Done:   ++counts_.complete; break;
        case NodeState::Failed: ++counts_.errors; break;
        default:                ++counts_.cancelled; break;
    }
    emit(event, oss.str());
}

void EventRecorder::on_batch_settled(const BatchId& batch, bool cancelled) {
    std::ostringstream oss;
    oss << R"(,"batchId":)" << quoted(batch)
        << R"(,"cancelled":)" << (cancelled ? "true" : "false");

    std::lock_guard lock(write_mutex_);
    ++counts_.batches_settled;
    emit("batchSettled", oss.str());
}

EventCounts EventRecorder::counts() const {
    std::lock_guard lock(write_mutex_);
    return counts_;
}

void EventRecorder::emit(std::string_view event, const std::string& fields) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"ts":)" << epoch_ms(std::chrono::system_clock::now())
        << fields
        << "}";
    sink_->write(oss.str());
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace graph_solver
