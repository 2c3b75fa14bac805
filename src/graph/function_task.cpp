/**
 * @file function_task.cpp
 * @brief FunctionTask, the ITask implementation behind make_task().
 */

#include "graph/function_task.hpp"

namespace graph_solver {

namespace {

class FunctionTask final : public ITask {
public:
    explicit FunctionTask(TaskDefinition def) : def_(std::move(def)) {
        if (def_.input_version.empty()) {
            def_.input_version = "v-" + def_.name;
        }
    }

    TaskKey key() const override { return make_key(def_.type, def_.name); }
    std::string type() const override { return def_.type; }
    std::string name() const override { return def_.name; }

    std::vector<TaskPtr> dependencies() const override { return def_.dependencies; }
    std::vector<TaskPtr> status_dependencies() const override { return def_.status_dependencies; }

    bool force() const noexcept override { return def_.force; }
    std::string input_version() const override { return def_.input_version; }
    std::optional<size_t> concurrency_limit() const noexcept override { return def_.concurrency_limit; }

    Result<TaskOutcome> get_status(const TaskContext& ctx) override {
        if (def_.get_status) {
            return finish(def_.get_status(*this, ctx), false);
        }
        return finish(TaskOutcome{def_.initial_state, {}}, false);
    }

    Result<TaskOutcome> process(const TaskContext& ctx) override {
        if (def_.process) {
            return finish(def_.process(*this, ctx), true);
        }
        return finish(TaskOutcome{ActionState::Ready, {}}, true);
    }

private:
    Result<TaskOutcome> finish(Result<TaskOutcome> result, bool processed) const {
        if (!result) return result;
        auto& outputs = result->outputs;
        outputs.try_emplace("id", key());
        outputs.try_emplace("processed", processed ? "true" : "false");
        return result;
    }

    TaskDefinition def_;
};

}  // anonymous namespace

TaskPtr make_task(TaskDefinition definition) {
    return std::make_shared<FunctionTask>(std::move(definition));
}

}  // namespace graph_solver
