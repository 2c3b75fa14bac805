/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error factories.
 */

#include "core/errors.hpp"
#include "core/result.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace graph_solver;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().kind, ErrorKind::Task);
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{"broken"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{"fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, AndThen) {
    Result<int> r = 4;
    auto halved = r.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{"odd"};
        return v / 2;
    });
    ASSERT_TRUE(halved.has_value());
    EXPECT_EQ(*halved, 2);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorKind::Graph, "nope"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::Graph);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorKind::Configuration, "bad value");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Configuration);
}

// ─── Error factories ─────────────────────────

TEST(ErrorsTest, CycleToString) {
    EXPECT_EQ(cycle_to_string({"test.a", "test.b", "test.c"}), "test.a <- test.b <- test.c <- test.a");
    EXPECT_EQ(cycle_to_string({}), "");
}

TEST(ErrorsTest, CircularDependencies) {
    auto err = circular_dependencies_error({"test.b", "test.a", "test.c"});
    EXPECT_EQ(err.kind, ErrorKind::CircularDependencies);
    EXPECT_EQ(err.message, "Circular task dependencies detected:\n\ntest.b <- test.a <- test.c <- test.b\n");
    EXPECT_EQ(err.keys, (std::vector<TaskKey>{"test.b", "test.a", "test.c"}));
}

TEST(ErrorsTest, CrashWrapsException) {
    std::runtime_error ex("boom");
    auto err = crash_error("build.api", "process", ex);
    EXPECT_EQ(err.kind, ErrorKind::Crash);
    EXPECT_EQ(err.message, "Unexpected error in build.api (process): boom");
    EXPECT_EQ(err.keys, std::vector<TaskKey>{"build.api"});
}

TEST(ErrorsTest, CascadeWrapsRootCause) {
    Error root{"disk full"};
    root.type = "io";

    auto first = cascade_error("build.api", root);
    EXPECT_EQ(first.kind, ErrorKind::Cascade);
    EXPECT_EQ(first.keys, std::vector<TaskKey>{"build.api"});
    ASSERT_EQ(first.wrapped.size(), 1u);
    EXPECT_EQ(first.wrapped.front().message, "disk full");
    EXPECT_NE(first.message.find("disk full"), std::string::npos);

    // Cascading further extends the chain but keeps the single root cause
    auto second = cascade_error("deploy.api", first);
    EXPECT_EQ(second.keys, (std::vector<TaskKey>{"build.api", "deploy.api"}));
    ASSERT_EQ(second.wrapped.size(), 1u);
    EXPECT_EQ(second.root_cause().message, "disk full");
    EXPECT_EQ(second.root_cause().type, "io");
    EXPECT_EQ(second.message, "Dependency build.api failed (via build.api -> deploy.api): disk full");
}

TEST(ErrorsTest, CancelledAndDeadline) {
    EXPECT_EQ(cancelled_error("batch-1").kind, ErrorKind::Cancelled);
    EXPECT_EQ(deadline_error("batch-1").kind, ErrorKind::DeadlineExceeded);
    EXPECT_NE(deadline_error("batch-7").message.find("batch-7"), std::string::npos);
}

TEST(ErrorsTest, Describe) {
    Error err{"invalid port"};
    EXPECT_EQ(describe(err), "task: invalid port");
    err.type = "validation";
    EXPECT_EQ(describe(err), "task/validation: invalid port");
}
