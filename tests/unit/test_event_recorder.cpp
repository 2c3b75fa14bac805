/**
 * @file test_event_recorder.cpp
 * @brief Unit tests for the NDJSON EventRecorder.
 */

#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace graph_solver;

class EventRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        buffer_ = sink->buffer();
        recorder_ = std::make_unique<EventRecorder>(std::move(sink));
    }

    const std::string& line(size_t i) const { return buffer_->lines.at(i); }

    static bool contains(const std::string& text, const std::string& fragment) {
        return text.find(fragment) != std::string::npos;
    }

    std::shared_ptr<MemorySink::Buffer> buffer_;
    std::unique_ptr<EventRecorder> recorder_;
};

TEST_F(EventRecorderTest, BatchEvents) {
    recorder_->on_batch_started("batch-1", {"test.a", "test.b"});
    recorder_->on_batch_settled("batch-1", false);

    ASSERT_EQ(buffer_->lines.size(), 2u);
    EXPECT_TRUE(contains(line(0), R"({"event":"batchStarted","ts":)"));
    EXPECT_TRUE(contains(line(0), R"("roots":["test.a","test.b"])"));
    EXPECT_TRUE(contains(line(1), R"("batchId":"batch-1","cancelled":false)"));

    auto counts = recorder_->counts();
    EXPECT_EQ(counts.batches_started, 1u);
    EXPECT_EQ(counts.batches_settled, 1u);
}

TEST_F(EventRecorderTest, TaskLifecycle) {
    recorder_->on_task_pending("build.api", "batch-1");
    recorder_->on_task_processing("build.api", TaskOperation::Status);
    recorder_->on_task_processing("build.api", TaskOperation::Process);

    GraphResult result;
    result.key = "build.api";
    result.type = "build";
    result.input_version = "v1";
    result.outcome = NodeState::Done;
    result.state = ActionState::Ready;
    result.processed = true;
    result.completed_at = std::chrono::system_clock::now();
    result.started_at = result.completed_at - std::chrono::milliseconds(25);
    recorder_->on_task_result(result);

    ASSERT_EQ(buffer_->lines.size(), 4u);
    EXPECT_TRUE(contains(line(0), R"("event":"taskPending")"));
    EXPECT_TRUE(contains(line(1), R"("operation":"status")"));
    EXPECT_TRUE(contains(line(2), R"("operation":"process")"));
    EXPECT_TRUE(contains(line(3), R"("event":"taskComplete")"));
    EXPECT_TRUE(contains(line(3), R"("state":"ready","processed":true,"durationMs":25)"));

    auto counts = recorder_->counts();
    EXPECT_EQ(counts.pending, 1u);
    EXPECT_EQ(counts.processing, 2u);
    EXPECT_EQ(counts.complete, 1u);
}

TEST_F(EventRecorderTest, ErrorAndCancelledResults) {
    GraphResult failed;
    failed.key = "build.api";
    failed.outcome = NodeState::Failed;
    failed.error = Error{"compile \"main\" failed"};
    recorder_->on_task_result(failed);

    GraphResult cancelled;
    cancelled.key = "deploy.api";
    cancelled.outcome = NodeState::Cancelled;
    cancelled.error = Error{ErrorKind::Cascade, "Dependency build.api failed"};
    recorder_->on_task_result(cancelled);

    ASSERT_EQ(buffer_->lines.size(), 2u);
    EXPECT_TRUE(contains(line(0), R"("event":"taskError")"));
    EXPECT_TRUE(contains(line(0), R"("errorKind":"task","error":"compile \"main\" failed")"));
    EXPECT_TRUE(contains(line(1), R"("event":"taskCancelled")"));
    EXPECT_TRUE(contains(line(1), R"("errorKind":"cascade")"));

    auto counts = recorder_->counts();
    EXPECT_EQ(counts.errors, 1u);
    EXPECT_EQ(counts.cancelled, 1u);
}
