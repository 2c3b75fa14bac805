/**
 * @file main.cpp
 * @brief graph_solver demo entry point.
 *
 * Wires the modules into a small build/deploy/test pipeline:
 *   Config -> Logger -> StatusCache -> Action tasks -> Solver -> Event recorder
 *
 * The pipeline runs twice against the same status cache. The second run
 * finds every action ready and short-circuits.
 */

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/action_task.hpp"
#include "solver/solver.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>

using namespace graph_solver;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<uint32_t> concurrency;
    std::string log_level;
    bool force = false;
    std::set<TaskKey> fail_keys;
};

void print_usage() {
    std::cout << "Usage: graph_solver [OPTIONS]\n"
              << "  --config <path>       Configuration file (default: config/default.toml)\n"
              << "  --concurrency <n>     Max tasks checking status or processing at once\n"
              << "  --log-level <level>   debug, info, warn or error\n"
              << "  --force               Process every action regardless of its status\n"
              << "  --fail <key>          Make the given action fail (repeatable), e.g. build.api\n"
              << "  --help, -h            Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--concurrency" && i + 1 < argc) {
            std::string_view text{argv[++i]};
            uint32_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
                return Error{ErrorKind::Configuration, "--concurrency expects a positive integer"};
            }
            args.concurrency = value;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--force") {
            args.force = true;
        } else if (arg == "--fail" && i + 1 < argc) {
            args.fail_keys.insert(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorKind::Configuration, "Unknown argument: " + arg};
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const LoggingConfig& logging, const std::string& prefix) {
    if (logging.sink == "file") {
        return std::make_unique<JsonFileSink>(logging.log_dir, prefix,
                                              logging.max_file_size_mb, logging.rotate_count);
    }
    if (logging.sink == "null") {
        return std::make_unique<NullSink>();
    }
    return std::make_unique<StdoutSink>();
}

/**
 * @brief The sample project: two services built, deployed and tested.
 *
 *   build.api    build.web
 *       |            |
 *   deploy.api <- deploy.web
 *       \           /
 *        test.integ   (status also depends on run.migrate)
 */
std::vector<TaskPtr> build_pipeline(StatusCache& cache, const CLIArgs& args) {
    auto work = [fail_keys = args.fail_keys](const ActionRequest& req) -> Result<TaskOutcome> {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (req.context.stop_requested()) {
            return Error{ErrorKind::Cancelled, req.key + " interrupted"};
        }
        if (fail_keys.contains(req.key)) {
            Error err{"Simulated failure in " + req.key};
            err.type = "demo";
            return err;
        }
        return TaskOutcome{ActionState::Ready, {{"version", "v1"}, {"target", req.name}}};
    };
    auto handlers = cached_handlers(cache, work);

    auto action = [&](ActionKind kind, std::string name, std::vector<TaskPtr> deps,
                      std::vector<TaskPtr> status_deps = {}) {
        return make_action_task(ActionTaskSpec{
            .kind = kind,
            .name = std::move(name),
            .handlers = handlers,
            .dependencies = std::move(deps),
            .status_dependencies = std::move(status_deps),
            .force = args.force,
            .version = "v1",
            .concurrency_limit = std::nullopt
        });
    };

    auto build_api = action(ActionKind::Build, "api", {});
    auto build_web = action(ActionKind::Build, "web", {});
    auto deploy_api = action(ActionKind::Deploy, "api", {build_api});
    auto deploy_web = action(ActionKind::Deploy, "web", {build_web, deploy_api});
    auto migrate = action(ActionKind::Run, "migrate", {deploy_api});
    auto test = action(ActionKind::Test, "integ", {deploy_api, deploy_web}, {migrate});

    return {test, migrate};
}

void print_results(const GraphResults& results) {
    std::cout << std::left
              << std::setw(16) << "TASK"
              << std::setw(11) << "OUTCOME"
              << std::setw(11) << "STATE"
              << std::setw(11) << "PROCESSED"
              << "ERROR\n";
    for (const auto& [key, result] : results) {
        std::cout << std::setw(16) << key
                  << std::setw(11) << to_string(result->outcome)
                  << std::setw(11) << to_string(result->state)
                  << std::setw(11) << (result->processed ? "yes" : "no")
                  << (result->error ? describe(*result->error) : std::string{}) << "\n";
    }
    std::cout << std::endl;
}

struct RunSummary {
    bool ok = false;
    size_t processed = 0;
};

/**
 * @brief Run one batch, cancelling it if a shutdown signal arrives.
 */
RunSummary run_once(const Config& config,
                    const std::vector<TaskPtr>& roots,
                    std::shared_ptr<Logger> logger,
                    std::shared_ptr<EventRecorder> recorder,
                    const std::string& label) {
    logger->info("=== " + label + " ===");

    Solver solver(Solver::Options{
        .config = config.solver,
        .logger = logger,
        .observer = recorder
    });

    auto batch = solver.start(roots);
    if (!batch) {
        std::cerr << describe(batch.error()) << std::endl;
        return {};
    }

    while (solver.batch_status(*batch) == BatchStatus::Active) {
        if (g_shutdown_requested) {
            logger->warn("Shutdown requested, cancelling " + *batch);
            if (auto cancelled = solver.cancel(*batch); !cancelled) {
                logger->error(cancelled.error().message);
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    auto settled = solver.wait_until_settled(*batch);
    auto results = solver.batch_results(*batch);
    if (results) {
        std::cout << label << "\n";
        print_results(*results);
    }
    if (!settled) {
        std::cerr << describe(settled.error()) << std::endl;
        return {};
    }

    RunSummary summary{.ok = true, .processed = 0};
    if (results) {
        for (const auto& [key, result] : *results) {
            if (!result->succeeded()) summary.ok = false;
            if (result->processed) ++summary.processed;
        }
    }
    return summary;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << std::endl;
        print_usage();
        return 2;
    }
    const auto& args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (auto env = apply_env_overrides(config); !env) {
        std::cerr << env.error().message << std::endl;
        return 2;
    }

    // Apply CLI overrides
    if (args.concurrency) config.solver.concurrency_limit = *args.concurrency;
    if (!args.log_level.empty()) config.logging.level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << valid.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    auto logger = std::make_shared<Logger>(make_sink(config.logging, config.logging.file_prefix),
                                           parse_log_level(config.logging.level).value_or(LogLevel::Info));
    logger->info("graph_solver starting (concurrency " + std::to_string(config.solver.concurrency_limit) + ")");

    // ── Initialize Events ────────────────────
    std::unique_ptr<ILogSink> event_sink;
    if (config.events.enabled) {
        event_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, config.events.file_prefix,
                                                    config.logging.max_file_size_mb,
                                                    config.logging.rotate_count);
    } else {
        event_sink = std::make_unique<NullSink>();
    }
    auto recorder = std::make_shared<EventRecorder>(std::move(event_sink));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    StatusCache cache;
    auto roots = build_pipeline(cache, args);

    auto first = run_once(config, roots, logger, recorder, "Run 1");
    RunSummary second;
    if (!g_shutdown_requested) {
        second = run_once(config, roots, logger, recorder, "Run 2");
    }

    auto counts = recorder->counts();
    logger->info("Processed " + std::to_string(first.processed) + " action(s) in run 1, "
                 + std::to_string(second.processed) + " in run 2; "
                 + std::to_string(counts.complete) + " complete, "
                 + std::to_string(counts.errors) + " failed, "
                 + std::to_string(counts.cancelled) + " cancelled");

    recorder->flush();
    logger->flush();
    return first.ok && second.ok ? 0 : 1;
}
