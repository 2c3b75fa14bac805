/**
 * @file resolver.hpp
 * @brief Dependency closure expansion and cycle detection.
 *
 * Walks dependencies() and status_dependencies() transitively from a set of
 * roots, deduplicating by key (first-seen instance wins), and rejects any
 * cycle over dependencies() edges with a structured CircularDependencies
 * error. Status-dependency edges never take part in cycle detection.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace graph_solver {

/**
 * @brief One deduplicated node of the closure. Edges are indices into
 * ResolvedGraph::nodes().
 */
struct ResolvedNode {
    TaskPtr task;
    TaskKey key;
    std::vector<size_t> dependencies;
    std::vector<size_t> status_dependencies;
};

/**
 * @brief The validated closure of a set of roots.
 */
class ResolvedGraph {
public:
    ResolvedGraph() = default;

    /// Nodes in first-seen (DFS preorder) order.
    [[nodiscard]] const std::vector<ResolvedNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] std::optional<size_t> find(const TaskKey& key) const;
    [[nodiscard]] const ResolvedNode* node(const TaskKey& key) const;

    /// Indices of the submitted roots, deduplicated, in submission order.
    [[nodiscard]] const std::vector<size_t>& roots() const noexcept { return roots_; }

    /// Nodes that list @p index in their dependencies().
    [[nodiscard]] std::vector<size_t> dependents(size_t index) const;

    /// Kahn's algorithm over dependency edges; dependencies come first.
    [[nodiscard]] std::vector<size_t> topological_order() const;

private:
    friend class DependencyResolver;

    std::vector<ResolvedNode> nodes_;
    std::unordered_map<TaskKey, size_t> index_;
    std::vector<size_t> roots_;
};

/**
 * @brief Expands root tasks into a ResolvedGraph.
 *
 * Each key's dependency lists are queried once and kept in an explicit
 * cache for the lifetime of the resolver; a resolver is meant to serve a
 * single solver run.
 */
class DependencyResolver {
public:
    DependencyResolver() = default;

    [[nodiscard]] Result<ResolvedGraph> resolve(const std::vector<TaskPtr>& roots);

    [[nodiscard]] size_t cached_count() const noexcept { return dependency_cache_.size(); }
    void clear_cache() { dependency_cache_.clear(); }

private:
    struct CachedDependencies {
        std::vector<TaskPtr> dependencies;
        std::vector<TaskPtr> status_dependencies;
    };

    const CachedDependencies& dependencies_of(const TaskKey& key, const ITask& task);

    [[nodiscard]] static Result<void> validate_task(const ITask& task);
    [[nodiscard]] static std::optional<std::vector<TaskKey>> find_cycle(const ResolvedGraph& graph);

    std::unordered_map<TaskKey, CachedDependencies> dependency_cache_;
};

}  // namespace graph_solver
