/**
 * @file generator.cpp
 * @brief Synthetic graph generator topologies.
 *
 * Tasks fix their dependencies at construction, so every topology is built
 * dependencies-first.
 */

#include "graph/generator.hpp"

#include <string>
#include <unordered_set>

namespace graph_solver {

namespace {

TaskPtr make_from_template(const TaskTemplate& tmpl, std::string name, std::vector<TaskPtr> deps) {
    return make_task(TaskDefinition{
        .type = tmpl.type,
        .name = std::move(name),
        .dependencies = std::move(deps),
        .status_dependencies = {},
        .force = false,
        .input_version = {},
        .concurrency_limit = std::nullopt,
        .initial_state = tmpl.initial_state,
        .get_status = tmpl.get_status,
        .process = tmpl.process
    });
}

/// Roots are the tasks no other generated task depends on.
void collect_roots(GeneratedGraph& graph) {
    std::unordered_set<TaskKey> depended_on;
    for (const auto& task : graph.tasks) {
        for (const auto& dep : task->dependencies()) {
            depended_on.insert(dep->key());
        }
    }
    for (const auto& task : graph.tasks) {
        if (!depended_on.contains(task->key())) {
            graph.roots.push_back(task);
        }
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain
// ─────────────────────────────────────────────

GeneratedGraph GraphGenerator::linear_chain(size_t num_tasks, const TaskTemplate& tmpl) {
    GeneratedGraph graph;

    TaskPtr prev;
    for (size_t i = 0; i < num_tasks; ++i) {
        std::vector<TaskPtr> deps;
        if (prev) deps.push_back(prev);
        prev = make_from_template(tmpl, "chain_" + std::to_string(i), std::move(deps));
        graph.tasks.push_back(prev);
    }

    collect_roots(graph);
    return graph;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          fan_src
//       /     |     \   (backslash)
//   branch_0 ... branch_{width-1}
//       \     |     /
//          fan_sink
// ─────────────────────────────────────────────

GeneratedGraph GraphGenerator::fan_out_fan_in(size_t width, const TaskTemplate& tmpl) {
    GeneratedGraph graph;

    auto src = make_from_template(tmpl, "fan_src", {});
    graph.tasks.push_back(src);

    std::vector<TaskPtr> branches;
    for (size_t i = 0; i < width; ++i) {
        auto branch = make_from_template(tmpl, "fan_branch_" + std::to_string(i), {src});
        graph.tasks.push_back(branch);
        branches.push_back(branch);
    }

    graph.tasks.push_back(make_from_template(tmpl, "fan_sink", std::move(branches)));

    collect_roots(graph);
    return graph;
}

// ─────────────────────────────────────────────
// Diamond: hub_d <- {diamond_d_w} <- merge_d <- hub_{d+1} ...
// ─────────────────────────────────────────────

GeneratedGraph GraphGenerator::diamond(size_t depth, size_t width, const TaskTemplate& tmpl) {
    GeneratedGraph graph;

    TaskPtr prev_merge;
    for (size_t d = 0; d < depth; ++d) {
        const auto level = std::to_string(d);

        std::vector<TaskPtr> hub_deps;
        if (prev_merge) hub_deps.push_back(prev_merge);
        auto hub = make_from_template(tmpl, "hub_" + level, std::move(hub_deps));
        graph.tasks.push_back(hub);

        std::vector<TaskPtr> branches;
        for (size_t w = 0; w < width; ++w) {
            auto branch = make_from_template(tmpl, "diamond_" + level + "_" + std::to_string(w), {hub});
            graph.tasks.push_back(branch);
            branches.push_back(branch);
        }

        prev_merge = make_from_template(tmpl, "merge_" + level, std::move(branches));
        graph.tasks.push_back(prev_merge);
    }

    collect_roots(graph);
    return graph;
}

// ─────────────────────────────────────────────
// Random DAG
// ─────────────────────────────────────────────

GeneratedGraph GraphGenerator::random_dag(size_t num_tasks,
                                          float edge_probability,
                                          std::mt19937& rng,
                                          const TaskTemplate& tmpl) {
    GeneratedGraph graph;
    graph.tasks.reserve(num_tasks);

    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    for (size_t j = 0; j < num_tasks; ++j) {
        std::vector<TaskPtr> deps;
        for (size_t i = 0; i < j; ++i) {
            if (edge_dist(rng) < edge_probability) {
                deps.push_back(graph.tasks[i]);
            }
        }
        graph.tasks.push_back(make_from_template(tmpl, "rand_" + std::to_string(j), std::move(deps)));
    }

    collect_roots(graph);
    return graph;
}

}  // namespace graph_solver
