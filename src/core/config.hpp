/**
 * @file config.hpp
 * @brief Solver configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "core/result.hpp"

namespace graph_solver {

/// Environment variable overriding solver.concurrency_limit.
inline constexpr const char* kConcurrencyLimitEnv = "GRAPH_SOLVER_CONCURRENCY_LIMIT";

struct SolverConfig {
    uint32_t concurrency_limit = 6;     ///< Max tasks in statusChecking/processing
    uint32_t thread_count = 0;          ///< 0 = concurrency_limit
    uint32_t deadline_ms = 0;           ///< 0 = no default deadline
    std::map<std::string, uint32_t> type_limits;  ///< Per task type bound
};

struct LoggingConfig {
    std::string level = "info";
    std::string sink = "stdout";        ///< "stdout", "file", "null"
    std::filesystem::path log_dir = "./logs";
    std::string file_prefix = "graph_solver";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

struct EventsConfig {
    bool enabled = false;
    std::string file_prefix = "events";  ///< Written under logging.log_dir
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SolverConfig solver;
    LoggingConfig logging;
    EventsConfig events;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the solver cannot run with.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Apply GRAPH_SOLVER_CONCURRENCY_LIMIT, if set and valid.
 */
Result<void> apply_env_overrides(Config& config);

}  // namespace graph_solver
