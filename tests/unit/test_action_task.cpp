/**
 * @file test_action_task.cpp
 * @brief Unit tests for action tasks and StatusCache.
 */

#include "graph/action_task.hpp"

#include <gtest/gtest.h>

using namespace graph_solver;

static TaskContext empty_context() {
    return TaskContext({}, {}, "batch-1");
}

// ─── Identity ────────────────────────────────

TEST(ActionTaskTest, KeyAndDescription) {
    auto task = make_action_task(ActionTaskSpec{
        .kind = ActionKind::Deploy,
        .name = "api",
        .version = "v-abc"
    });
    EXPECT_EQ(task->key(), "deploy.api");
    EXPECT_EQ(task->type(), "deploy");
    EXPECT_EQ(task->name(), "api");
    EXPECT_EQ(task->description(), "deploy api");
    EXPECT_EQ(task->input_version(), "v-abc");
    EXPECT_FALSE(task->force());
}

TEST(ActionTaskTest, KindToString) {
    EXPECT_EQ(to_string(ActionKind::Build), "build");
    EXPECT_EQ(to_string(ActionKind::Run), "run");
    EXPECT_EQ(to_string(ActionKind::Test), "test");
}

TEST(ActionTaskTest, DefaultHandlers) {
    auto task = make_action_task(ActionTaskSpec{.kind = ActionKind::Build, .name = "web"});
    auto ctx = empty_context();

    auto status = task->get_status(ctx);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, ActionState::Unknown);

    auto processed = task->process(ctx);
    ASSERT_TRUE(processed.has_value());
    EXPECT_EQ(processed->state, ActionState::Ready);
}

TEST(ActionTaskTest, HandlerSeesRequest) {
    ActionHandlers handlers;
    handlers.process = [](const ActionRequest& req) -> Result<TaskOutcome> {
        EXPECT_EQ(req.kind, ActionKind::Run);
        EXPECT_EQ(req.name, "migrate");
        EXPECT_EQ(req.key, "run.migrate");
        EXPECT_EQ(req.context.batch_id(), "batch-1");
        return TaskOutcome{ActionState::Ready, {{"log", "ok"}}};
    };

    auto task = make_action_task(ActionTaskSpec{
        .kind = ActionKind::Run,
        .name = "migrate",
        .handlers = handlers
    });
    auto ctx = empty_context();
    auto result = task->process(ctx);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outputs.at("log"), "ok");
}

TEST(ActionTaskTest, HandlerErrorPropagates) {
    ActionHandlers handlers;
    handlers.get_status = [](const ActionRequest&) -> Result<TaskOutcome> {
        Error err{"registry unreachable"};
        err.type = "network";
        return err;
    };

    auto task = make_action_task(ActionTaskSpec{.kind = ActionKind::Build, .name = "api", .handlers = handlers});
    auto ctx = empty_context();
    auto result = task->get_status(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().type, "network");
}

// ─── StatusCache ─────────────────────────────

TEST(StatusCacheTest, PutGetErase) {
    StatusCache cache;
    EXPECT_FALSE(cache.get("build.api").has_value());

    cache.put("build.api", TaskOutcome{ActionState::Ready, {}});
    ASSERT_TRUE(cache.get("build.api").has_value());
    EXPECT_EQ(cache.get("build.api")->state, ActionState::Ready);
    EXPECT_EQ(cache.cached_keys(), std::set<TaskKey>{"build.api"});

    cache.erase("build.api");
    EXPECT_FALSE(cache.get("build.api").has_value());
}

TEST(StatusCacheTest, CachedHandlersShortCircuitSecondRun) {
    StatusCache cache;
    int work_calls = 0;
    auto handlers = cached_handlers(cache, [&](const ActionRequest&) -> Result<TaskOutcome> {
        ++work_calls;
        return TaskOutcome{ActionState::Ready, {{"image", "api:1"}}};
    });

    auto task = make_action_task(ActionTaskSpec{.kind = ActionKind::Build, .name = "api", .handlers = handlers});
    auto ctx = empty_context();

    auto before = task->get_status(ctx);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->state, ActionState::Unknown);

    ASSERT_TRUE(task->process(ctx).has_value());
    EXPECT_EQ(work_calls, 1);
    EXPECT_EQ(cache.processed_keys(), std::set<TaskKey>{"build.api"});

    auto after = task->get_status(ctx);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->state, ActionState::Ready);
    EXPECT_EQ(after->outputs.at("image"), "api:1");
}

TEST(StatusCacheTest, FailedWorkIsNotCached) {
    StatusCache cache;
    auto handlers = cached_handlers(cache, [](const ActionRequest&) -> Result<TaskOutcome> {
        return Error{"compile error"};
    });

    auto task = make_action_task(ActionTaskSpec{.kind = ActionKind::Build, .name = "api", .handlers = handlers});
    auto ctx = empty_context();
    EXPECT_FALSE(task->process(ctx).has_value());
    EXPECT_TRUE(cache.cached_keys().empty());
    EXPECT_TRUE(cache.processed_keys().empty());
}

TEST(StatusCacheTest, ClearDropsEverything) {
    StatusCache cache;
    cache.put("build.api", TaskOutcome{ActionState::Ready, {}});
    cache.mark_processed("build.api");
    cache.clear();
    EXPECT_TRUE(cache.cached_keys().empty());
    EXPECT_TRUE(cache.processed_keys().empty());
}
