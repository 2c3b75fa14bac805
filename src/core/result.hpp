/**
 * @file result.hpp
 * @brief Monadic error handling type for graph_solver.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Task
 * implementations, the resolver and the solver all report failures through
 * it; exceptions are only caught at the task boundary and converted into
 * crash errors.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace graph_solver {

/**
 * @brief Error taxonomy.
 */
enum class ErrorKind : uint8_t {
    Task,                  ///< Structured error raised by a task implementation
    Crash,                 ///< Unexpected exception escaping getStatus/process
    Cascade,               ///< Dependent cancelled because a dependency failed
    Cancelled,             ///< Batch cancellation
    DeadlineExceeded,      ///< Caller-supplied deadline elapsed
    CircularDependencies,  ///< Cycle over dependency edges
    TaskDefinition,        ///< Task without a type or a name
    Configuration,         ///< Invalid configuration input
    Graph                  ///< Misuse of the solver API (unknown batch, ...)
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Task:                 return "task";
        case ErrorKind::Crash:                return "crash";
        case ErrorKind::Cascade:              return "cascade";
        case ErrorKind::Cancelled:            return "cancelled";
        case ErrorKind::DeadlineExceeded:     return "deadline-exceeded";
        case ErrorKind::CircularDependencies: return "circular-dependencies";
        case ErrorKind::TaskDefinition:       return "task-definition";
        case ErrorKind::Configuration:        return "configuration";
        case ErrorKind::Graph:                return "graph";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind, a descriptive message and its causes.
 *
 * `type` is a free-form tag a task implementation may set on its own domain
 * errors (e.g. "validation"); it is preserved as-is by the solver.
 * `keys` holds the cycle for CircularDependencies and the dependency chain
 * (root failure first) for Cascade.
 */
struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::Task;
    std::string type;
    std::vector<TaskKey> keys;
    std::vector<Error> wrapped;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : message(std::move(msg)), kind(k) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// The innermost cause, following the first wrapped error.
    [[nodiscard]] const Error& root_cause() const noexcept {
        const Error* e = this;
        while (!e->wrapped.empty()) e = &e->wrapped.front();
        return *e;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace graph_solver
