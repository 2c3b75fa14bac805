/**
 * @file errors.hpp
 * @brief Factories for the solver's error taxonomy.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace graph_solver {

/// Render a cycle as "a <- b <- c <- a".
[[nodiscard]] std::string cycle_to_string(const std::vector<TaskKey>& cycle);

[[nodiscard]] Error circular_dependencies_error(std::vector<TaskKey> cycle);

/// Wrap an exception that escaped a task's getStatus/process.
[[nodiscard]] Error crash_error(const TaskKey& key, std::string_view operation, const std::exception& ex);
[[nodiscard]] Error crash_error(const TaskKey& key, std::string_view operation, std::string_view what);

/**
 * @brief Build the error attached to a dependent cancelled by a failed dependency.
 *
 * If @p dependency_error is itself a cascade, the chain is extended and the
 * original failure stays the single wrapped cause.
 */
[[nodiscard]] Error cascade_error(const TaskKey& failed_dependency, const Error& dependency_error);

[[nodiscard]] Error cancelled_error(const BatchId& batch_id);
[[nodiscard]] Error deadline_error(const BatchId& batch_id);

/// One-line rendering: "<kind>[/<type>]: <message>".
[[nodiscard]] std::string describe(const Error& error);

}  // namespace graph_solver
