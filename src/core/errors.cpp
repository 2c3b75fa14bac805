/**
 * @file errors.cpp
 * @brief Error factory implementations.
 */

#include "core/errors.hpp"

#include <sstream>

namespace graph_solver {

std::string cycle_to_string(const std::vector<TaskKey>& cycle) {
    if (cycle.empty()) return {};

    std::ostringstream oss;
    for (const auto& key : cycle) {
        oss << key << " <- ";
    }
    oss << cycle.front();
    return oss.str();
}

Error circular_dependencies_error(std::vector<TaskKey> cycle) {
    Error err{ErrorKind::CircularDependencies,
              "Circular task dependencies detected:\n\n" + cycle_to_string(cycle) + "\n"};
    err.keys = std::move(cycle);
    return err;
}

Error crash_error(const TaskKey& key, std::string_view operation, const std::exception& ex) {
    return crash_error(key, operation, ex.what());
}

Error crash_error(const TaskKey& key, std::string_view operation, std::string_view what) {
    Error err{ErrorKind::Crash,
              "Unexpected error in " + key + " (" + std::string{operation} + "): " + std::string{what}};
    err.keys = {key};
    return err;
}

Error cascade_error(const TaskKey& failed_dependency, const Error& dependency_error) {
    std::vector<TaskKey> chain;
    Error root = dependency_error;

    if (dependency_error.kind == ErrorKind::Cascade && !dependency_error.wrapped.empty()) {
        chain = dependency_error.keys;
        root = dependency_error.wrapped.front();
    }
    chain.push_back(failed_dependency);

    std::string via;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) via += " -> ";
        via += chain[i];
    }

    Error err{ErrorKind::Cascade,
              "Dependency " + chain.front() + " failed (via " + via + "): " + root.message};
    err.keys = std::move(chain);
    err.wrapped.push_back(std::move(root));
    return err;
}

Error cancelled_error(const BatchId& batch_id) {
    return Error{ErrorKind::Cancelled, "Batch " + batch_id + " was cancelled"};
}

Error deadline_error(const BatchId& batch_id) {
    return Error{ErrorKind::DeadlineExceeded, "Deadline exceeded for batch " + batch_id};
}

std::string describe(const Error& error) {
    std::string out{to_string(error.kind)};
    if (!error.type.empty()) {
        out += "/" + error.type;
    }
    out += ": " + error.message;
    return out;
}

}  // namespace graph_solver
