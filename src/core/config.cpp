/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

#include <toml++/toml.hpp>

namespace graph_solver {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Configuration, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [solver]
        if (auto solver = tbl["solver"]; solver.is_table()) {
            config.solver.concurrency_limit = static_cast<uint32_t>(
                solver["concurrency_limit"].value_or(int64_t{6}));
            config.solver.thread_count = static_cast<uint32_t>(
                solver["thread_count"].value_or(int64_t{0}));
            config.solver.deadline_ms = static_cast<uint32_t>(
                solver["deadline_ms"].value_or(int64_t{0}));

            // [solver.type_limits]
            if (auto* limits = solver["type_limits"].as_table()) {
                for (const auto& [type, value] : *limits) {
                    auto limit = value.value<int64_t>();
                    if (!limit || *limit < 0) {
                        return Error{ErrorKind::Configuration,
                                     "solver.type_limits." + std::string{type.str()}
                                     + " must be a non-negative integer"};
                    }
                    config.solver.type_limits[std::string{type.str()}] = static_cast<uint32_t>(*limit);
                }
            }
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.level = logging["level"].value_or(std::string{"info"});
            config.logging.sink = logging["sink"].value_or(std::string{"stdout"});
            config.logging.log_dir = logging["log_dir"].value_or(std::string{"./logs"});
            config.logging.file_prefix = logging["file_prefix"].value_or(std::string{"graph_solver"});
            config.logging.max_file_size_mb = static_cast<uint32_t>(
                logging["max_file_size_mb"].value_or(int64_t{50}));
            config.logging.rotate_count = static_cast<uint32_t>(
                logging["rotate_count"].value_or(int64_t{5}));
        }

        // [events]
        if (auto events = tbl["events"]; events.is_table()) {
            config.events.enabled = events["enabled"].value_or(false);
            config.events.file_prefix = events["file_prefix"].value_or(std::string{"events"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Configuration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.solver.concurrency_limit == 0) {
        return Error{ErrorKind::Configuration, "solver.concurrency_limit must be at least 1"};
    }
    for (const auto& [type, limit] : config.solver.type_limits) {
        if (limit == 0) {
            return Error{ErrorKind::Configuration,
                         "solver.type_limits." + type + " must be at least 1"};
        }
    }
    if (!parse_log_level(config.logging.level)) {
        return Error{ErrorKind::Configuration, "Unknown logging.level: " + config.logging.level};
    }
    const auto& sink = config.logging.sink;
    if (sink != "stdout" && sink != "file" && sink != "null") {
        return Error{ErrorKind::Configuration, "Unknown logging.sink: " + sink};
    }
    return {};
}

Result<void> apply_env_overrides(Config& config) {
    const char* raw = std::getenv(kConcurrencyLimitEnv);
    if (raw == nullptr || *raw == '\0') return {};

    std::string_view text{raw};
    uint32_t limit = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
    if (ec != std::errc{} || ptr != text.data() + text.size() || limit == 0) {
        return Error{ErrorKind::Configuration,
                     std::string{kConcurrencyLimitEnv} + " must be a positive integer, got '"
                     + std::string{text} + "'"};
    }
    config.solver.concurrency_limit = limit;
    return {};
}

}  // namespace graph_solver
