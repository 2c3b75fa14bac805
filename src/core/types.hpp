/**
 * @file types.hpp
 * @brief Fundamental types used throughout graph_solver.
 *
 * Defines TaskKey, BatchId, ActionState, NodeState and the other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace graph_solver {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskKey = std::string;      ///< "<type>.<name>", e.g. "build.api"
using BatchId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Opaque key/value outputs reported by a task.
using Outputs = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Action State
// ─────────────────────────────────────────────

/**
 * @brief State reported by a task's status check or processing.
 *
 * Only Ready permits the status short-circuit.
 */
enum class ActionState : uint8_t {
    NotReady,
    Ready,
    Unknown,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ActionState state) noexcept {
    switch (state) {
        case ActionState::NotReady: return "not-ready";
        case ActionState::Ready:    return "ready";
        case ActionState::Unknown:  return "unknown";
        case ActionState::Failed:   return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ActionState> parse_action_state(std::string_view s) noexcept {
    if (s == "not-ready") return ActionState::NotReady;
    if (s == "ready")     return ActionState::Ready;
    if (s == "unknown")   return ActionState::Unknown;
    if (s == "failed")    return ActionState::Failed;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Node State (per task key, within one run)
// ─────────────────────────────────────────────

enum class NodeState : uint8_t {
    Pending,         ///< Activated, waiting on dependencies or admission
    StatusChecking,  ///< getStatus in flight
    Processing,      ///< process in flight
    Done,            ///< Short-circuited or processed successfully
    Failed,          ///< getStatus/process reported an error
    Cancelled        ///< Cascade from a failed dependency, or batch cancellation
};

[[nodiscard]] constexpr std::string_view to_string(NodeState state) noexcept {
    switch (state) {
        case NodeState::Pending:        return "pending";
        case NodeState::StatusChecking: return "status-checking";
        case NodeState::Processing:     return "processing";
        case NodeState::Done:           return "done";
        case NodeState::Failed:         return "failed";
        case NodeState::Cancelled:      return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(NodeState state) noexcept {
    return state == NodeState::Done
        || state == NodeState::Failed
        || state == NodeState::Cancelled;
}

}  // namespace graph_solver
