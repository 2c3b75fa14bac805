/**
 * @file bench_solver.cpp
 * @brief Performance benchmarks for graph resolution and solver scheduling.
 *
 * Measures closure expansion, cycle detection and end-to-end solver
 * overhead for the synthetic topologies in GraphGenerator.
 *
 * Usage: ./bench_solver [--csv]
 */

#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "graph/generator.hpp"
#include "graph/resolver.hpp"
#include "solver/solver.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace graph_solver;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n== " << current_cat << " ==\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// Run one fresh solver over @p graph; every task needs processing.
void solve_once(const GeneratedGraph& graph, uint32_t limit) {
    Solver::Options opts;
    opts.config.concurrency_limit = limit;
    Solver solver(std::move(opts));
    auto results = solver.submit(graph.roots);
    if (!results || results->size() != graph.tasks.size()) {
        std::cerr << "solver run incomplete\n";
    }
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_resolver() {
    std::vector<BenchResult> R;
    constexpr size_t N = 200;

    for (size_t n : {10, 100, 1000}) {
        auto chain = GraphGenerator::linear_chain(n);
        R.push_back(run_bench("resolve_chain(" + std::to_string(n) + ")", "Resolution", N,
            [&]{ DependencyResolver r; auto g = r.resolve(chain.roots); (void)g; },
            std::to_string(n) + " tasks"));
    }

    for (size_t w : {16, 64}) {
        auto diamond = GraphGenerator::diamond(8, w);
        R.push_back(run_bench("resolve_diamond(8x" + std::to_string(w) + ")", "Resolution", N,
            [&]{ DependencyResolver r; auto g = r.resolve(diamond.roots); (void)g; },
            std::to_string(diamond.tasks.size()) + " tasks"));
    }

    std::mt19937 rng(42);
    auto random = GraphGenerator::random_dag(300, 0.05f, rng);
    R.push_back(run_bench("resolve_random(300)", "Resolution", N,
        [&]{ DependencyResolver r; auto g = r.resolve(random.roots); (void)g; },
        std::to_string(random.roots.size()) + " roots"));

    DependencyResolver warm;
    (void)warm.resolve(random.roots);
    R.push_back(run_bench("resolve_random_cached(300)", "Resolution", N,
        [&]{ auto g = warm.resolve(random.roots); (void)g; }, "dependency cache warm"));

    DependencyResolver once;
    auto resolved = once.resolve(random.roots);
    if (resolved) {
        R.push_back(run_bench("topological_order(300)", "Resolution", N,
            [&]{ auto o = resolved->topological_order(); (void)o; }, "300 tasks"));
    }

    return R;
}

std::vector<BenchResult> bench_solver() {
    std::vector<BenchResult> R;
    constexpr size_t N = 30;

    for (size_t n : {10, 100}) {
        auto chain = GraphGenerator::linear_chain(n);
        R.push_back(run_bench("solve_chain(" + std::to_string(n) + ")", "Solver", N,
            [&]{ solve_once(chain, 4); }, "limit 4"));
    }

    for (uint32_t limit : {1u, 4u, 16u}) {
        auto fan = GraphGenerator::fan_out_fan_in(64);
        R.push_back(run_bench("solve_fan(64), limit " + std::to_string(limit), "Solver", N,
            [&]{ solve_once(fan, limit); }, "66 tasks"));
    }

    TaskTemplate ready;
    ready.initial_state = ActionState::Ready;
    auto short_circuit = GraphGenerator::diamond(4, 16, ready);
    R.push_back(run_bench("solve_diamond_ready(4x16)", "Solver", N,
        [&]{
            Solver solver;
            auto r = solver.submit(short_circuit.roots);
            (void)r;
        }, "roots ready, closure untouched"));

    return R;
}

std::vector<BenchResult> bench_executor() {
    std::vector<BenchResult> R;

    for (size_t threads : {1, 4}) {
        ThreadPool pool(threads);
        R.push_back(run_bench("pool_post_1000(" + std::to_string(threads) + "T)", "Executor", 50,
            [&]{
                for (int i = 0; i < 1000; ++i) pool.post([](std::stop_token) {});
                pool.wait_idle();
            }, "1000 empty jobs"));
    }

    return R;
}

// ─────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  graph_solver Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_resolver());
    append(bench_solver());
    append(bench_executor());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
