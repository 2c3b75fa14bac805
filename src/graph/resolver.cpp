/**
 * @file resolver.cpp
 * @brief DependencyResolver and ResolvedGraph implementations.
 *
 * Closure expansion is an iterative DFS preorder (dependencies before status
 * dependencies). Cycle detection uses white/gray/black coloring over
 * dependency edges only; the reported cycle is the gray path slice starting
 * at the node that was reached twice.
 */

#include "graph/resolver.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_set>

namespace graph_solver {

// ─────────────────────────────────────────────
// ResolvedGraph
// ─────────────────────────────────────────────

std::optional<size_t> ResolvedGraph::find(const TaskKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

const ResolvedNode* ResolvedGraph::node(const TaskKey& key) const {
    auto idx = find(key);
    return idx ? &nodes_[*idx] : nullptr;
}

std::vector<size_t> ResolvedGraph::dependents(size_t index) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const auto& deps = nodes_[i].dependencies;
        if (std::find(deps.begin(), deps.end(), index) != deps.end()) {
            out.push_back(i);
        }
    }
    return out;
}

std::vector<size_t> ResolvedGraph::topological_order() const {
    std::vector<size_t> in_degree(nodes_.size(), 0);
    std::vector<std::vector<size_t>> forward(nodes_.size());

    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (size_t dep : nodes_[i].dependencies) {
            forward[dep].push_back(i);
            ++in_degree[i];
        }
    }

    std::queue<size_t> zero_in;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (in_degree[i] == 0) zero_in.push(i);
    }

    std::vector<size_t> order;
    order.reserve(nodes_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        for (size_t next : forward[current]) {
            if (--in_degree[next] == 0) {
                zero_in.push(next);
            }
        }
    }

    return order;
}

// ─────────────────────────────────────────────
// DependencyResolver
// ─────────────────────────────────────────────

Result<void> DependencyResolver::validate_task(const ITask& task) {
    if (task.type().empty() || task.name().empty()) {
        return Error{ErrorKind::TaskDefinition,
                     "Task must have a non-empty type and name (got key '" + task.key() + "')"};
    }
    return {};
}

const DependencyResolver::CachedDependencies&
DependencyResolver::dependencies_of(const TaskKey& key, const ITask& task) {
    auto it = dependency_cache_.find(key);
    if (it == dependency_cache_.end()) {
        it = dependency_cache_.emplace(
            key, CachedDependencies{task.dependencies(), task.status_dependencies()}).first;
    }
    return it->second;
}

Result<ResolvedGraph> DependencyResolver::resolve(const std::vector<TaskPtr>& roots) {
    ResolvedGraph graph;

    // Pass 1: collect nodes in preorder, first-seen instance per key
    std::stack<TaskPtr> pending;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        if (!*it) {
            return Error{ErrorKind::TaskDefinition, "Cannot resolve a null task"};
        }
        pending.push(*it);
    }

    while (!pending.empty()) {
        auto task = pending.top();
        pending.pop();

        auto key = task->key();
        if (graph.index_.contains(key)) continue;

        if (auto valid = validate_task(*task); !valid) {
            return valid.error();
        }

        graph.index_.emplace(key, graph.nodes_.size());
        graph.nodes_.push_back(ResolvedNode{task, key, {}, {}});

        const auto& cached = dependencies_of(key, *task);
        for (auto it = cached.status_dependencies.rbegin(); it != cached.status_dependencies.rend(); ++it) {
            if (*it) pending.push(*it);
        }
        for (auto it = cached.dependencies.rbegin(); it != cached.dependencies.rend(); ++it) {
            if (*it) pending.push(*it);
        }
    }

    // Pass 2: wire edges to the first-seen instances
    for (auto& node : graph.nodes_) {
        const auto& cached = dependencies_of(node.key, *node.task);
        std::unordered_set<size_t> seen;
        for (const auto& dep : cached.dependencies) {
            if (!dep) continue;
            size_t idx = graph.index_.at(dep->key());
            if (seen.insert(idx).second) node.dependencies.push_back(idx);
        }
        seen.clear();
        for (const auto& dep : cached.status_dependencies) {
            if (!dep) continue;
            size_t idx = graph.index_.at(dep->key());
            if (seen.insert(idx).second) node.status_dependencies.push_back(idx);
        }
    }

    for (const auto& root : roots) {
        size_t idx = graph.index_.at(root->key());
        if (std::find(graph.roots_.begin(), graph.roots_.end(), idx) == graph.roots_.end()) {
            graph.roots_.push_back(idx);
        }
    }

    if (auto cycle = find_cycle(graph)) {
        return circular_dependencies_error(std::move(*cycle));
    }

    return graph;
}

std::optional<std::vector<TaskKey>> DependencyResolver::find_cycle(const ResolvedGraph& graph) {
    enum class Color : uint8_t { White, Gray, Black };
    const auto& nodes = graph.nodes();
    std::vector<Color> color(nodes.size(), Color::White);

    struct Frame {
        size_t node;
        size_t neighbor_idx;
    };

    for (size_t start = 0; start < nodes.size(); ++start) {
        if (color[start] != Color::White) continue;

        // A vector rather than std::stack so the gray path can be sliced
        std::vector<Frame> path;
        path.push_back({start, 0});
        color[start] = Color::Gray;

        while (!path.empty()) {
            auto& [node, idx] = path.back();
            const auto& deps = nodes[node].dependencies;

            if (idx >= deps.size()) {
                color[node] = Color::Black;
                path.pop_back();
                continue;
            }

            size_t neighbor = deps[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                auto from = std::find_if(path.begin(), path.end(),
                                         [neighbor](const Frame& f) { return f.node == neighbor; });
                std::vector<TaskKey> cycle;
                for (auto it = from; it != path.end(); ++it) {
                    cycle.push_back(nodes[it->node].key);
                }
                return cycle;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                path.push_back({neighbor, 0});
            }
        }
    }

    return std::nullopt;
}

}  // namespace graph_solver
