/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace graph_solver;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "gs_test_config";
        std::filesystem::create_directories(temp_dir_);
        ::unsetenv(kConcurrencyLimitEnv);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
        ::unsetenv(kConcurrencyLimitEnv);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.solver.concurrency_limit, 6u);
    EXPECT_EQ(config.solver.thread_count, 0u);
    EXPECT_EQ(config.solver.deadline_ms, 0u);
    EXPECT_TRUE(config.solver.type_limits.empty());
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.sink, "stdout");
    EXPECT_FALSE(config.events.enabled);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [solver]
        concurrency_limit = 3
        thread_count = 8
        deadline_ms = 1500

        [solver.type_limits]
        deploy = 1
        build = 4

        [logging]
        level = "debug"
        sink = "file"
        log_dir = "/tmp/gs_logs"
        file_prefix = "solver"
        max_file_size_mb = 10
        rotate_count = 2

        [events]
        enabled = true
        file_prefix = "solver_events"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.solver.concurrency_limit, 3u);
    EXPECT_EQ(config.solver.thread_count, 8u);
    EXPECT_EQ(config.solver.deadline_ms, 1500u);
    ASSERT_EQ(config.solver.type_limits.size(), 2u);
    EXPECT_EQ(config.solver.type_limits.at("deploy"), 1u);
    EXPECT_EQ(config.solver.type_limits.at("build"), 4u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.sink, "file");
    EXPECT_EQ(config.logging.log_dir, std::filesystem::path{"/tmp/gs_logs"});
    EXPECT_EQ(config.logging.file_prefix, "solver");
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_EQ(config.logging.rotate_count, 2u);
    EXPECT_TRUE(config.events.enabled);
    EXPECT_EQ(config.events.file_prefix, "solver_events");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [solver]
        concurrency_limit = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->solver.concurrency_limit, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->solver.thread_count, 0u);
    EXPECT_EQ(result->logging.level, "info");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, ZeroConcurrencyRejected) {
    auto path = write_toml(R"(
        [solver]
        concurrency_limit = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("concurrency_limit"), std::string::npos);
}

TEST_F(ConfigTest, ZeroTypeLimitRejected) {
    auto path = write_toml(R"(
        [solver.type_limits]
        deploy = 0
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, NegativeTypeLimitRejected) {
    auto path = write_toml(R"(
        [solver.type_limits]
        deploy = -2
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto path = write_toml(R"(
        [logging]
        level = "chatty"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, UnknownSinkRejected) {
    auto config = default_config();
    config.logging.sink = "syslog";
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, EnvOverride) {
    ::setenv(kConcurrencyLimitEnv, "11", 1);
    auto config = default_config();
    ASSERT_TRUE(apply_env_overrides(config).has_value());
    EXPECT_EQ(config.solver.concurrency_limit, 11u);
}

TEST_F(ConfigTest, EnvOverrideUnsetKeepsValue) {
    auto config = default_config();
    config.solver.concurrency_limit = 4;
    ASSERT_TRUE(apply_env_overrides(config).has_value());
    EXPECT_EQ(config.solver.concurrency_limit, 4u);
}

TEST_F(ConfigTest, EnvOverrideInvalid) {
    ::setenv(kConcurrencyLimitEnv, "lots", 1);
    auto config = default_config();
    auto result = apply_env_overrides(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(config.solver.concurrency_limit, 6u);

    ::setenv(kConcurrencyLimitEnv, "0", 1);
    EXPECT_FALSE(apply_env_overrides(config).has_value());
}
