#include "TaskRunner.hpp"
#include "DependencyGraph.hpp"
#include "DependencyStarter.hpp"
#include "LogUtils.hpp"
#include "OrchestrationErrors.hpp"
#include "VolumeResolver.hpp"
#include <future>
#include <iostream>
#include <thread>

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Planning:                 return "Planning";
        case RunState::RunningPrerequisites:     return "RunningPrerequisites";
        case RunState::ProvisioningDependencies: return "ProvisioningDependencies";
        case RunState::RunningMainTask:          return "RunningMainTask";
        case RunState::TearingDown:              return "TearingDown";
        case RunState::Completed:                return "Completed";
        case RunState::Failed:                   return "Failed";
    }
    return "Unknown";
}

namespace {

double seconds_since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

}

TaskRunner::TaskRunner(const ConfigData& config, IContainerRuntime& runtime, const CancellationToken& cancellation)
    : config_(config),
      runtime_(runtime),
      cancellation_(cancellation),
      on_stdout_([](const std::string& chunk) { std::cout << chunk << std::flush; }),
      on_stderr_([](const std::string& chunk) { std::cerr << chunk << std::flush; }) {
    readiness_.timeout = config.global.readiness_timeout;
}

void TaskRunner::set_output(OutputCallback on_stdout, OutputCallback on_stderr) {
    on_stdout_ = std::move(on_stdout);
    on_stderr_ = std::move(on_stderr);
}

void TaskRunner::transition(RunState next) {
    LogUtils::debug("State {} -> {}", to_string(state_.load()), to_string(next));
    state_.store(next);
    history_.push_back(next);
}

TaskResult TaskRunner::finish(TaskResult result, RunState final_state, std::chrono::steady_clock::time_point started) {
    transition(final_state);
    result.final_state = final_state;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return result;
}

TaskResult TaskRunner::run(const std::string& task_name) {
    const auto started = std::chrono::steady_clock::now();
    history_.clear();

    TaskResult result;
    result.task_name = task_name;

    transition(RunState::Planning);
    RunPlan plan;
    try {
        DependencyGraph graph(config_);
        ExecutionPlanner planner(graph);
        plan = planner.plan(task_name, config_.global.skip_prerequisites);
    } catch (const ConfigGraphError& e) {
        LogUtils::error("{}", e.what());
        result.error = e.what();
        result.exit_code = ORCHESTRATION_FAILURE_EXIT_CODE;
        return finish(std::move(result), RunState::Failed, started);
    }
    LogUtils::debug("Run plan for '{}':\n{}", task_name, plan.describe());

    RunContext context(config_.project_name, RunContext::generate_run_id(), config_.config_dir);
    NetworkProvisioner network(runtime_, context);

    if (plan.stages.size() > 1) {
        transition(RunState::RunningPrerequisites);
    }

    StageOutcome outcome;
    for (size_t i = 0; i < plan.stages.size(); ++i) {
        const bool is_target = i + 1 == plan.stages.size();
        if (cancelled()) {
            outcome.error = "Interrupted";
            outcome.exit_code = INTERRUPTED_EXIT_CODE;
            break;
        }

        outcome = execute_stage(plan.stages[i], is_target, network, context);
        result.cleanup_errors.insert(result.cleanup_errors.end(),
                                     outcome.cleanup_errors.begin(), outcome.cleanup_errors.end());
        if (!outcome.ok()) {
            if (!is_target) {
                LogUtils::error("Prerequisite '{}' failed, not running '{}'", plan.stages[i].task, task_name);
            }
            break;
        }
    }

    if (state_.load() != RunState::TearingDown) {
        transition(RunState::TearingDown);
    }
    try {
        network.remove_network();
    } catch (const CleanupError& e) {
        LogUtils::error("{}", e.what());
        result.cleanup_errors.insert(result.cleanup_errors.end(), e.failures().begin(), e.failures().end());
    }

    result.exit_code = outcome.exit_code;
    result.error = outcome.error;
    if (outcome.ok() && !result.cleanup_errors.empty()) {
        result.exit_code = ORCHESTRATION_FAILURE_EXIT_CODE;
        result.error = CleanupError(result.cleanup_errors).what();
    }

    const RunState final_state = result.exit_code == 0 && !result.error ? RunState::Completed : RunState::Failed;
    result = finish(std::move(result), final_state, started);
    LogUtils::info("'{}' {} with exit code {} in {:.1f}s", task_name,
                   final_state == RunState::Completed ? "completed" : "failed",
                   result.exit_code, seconds_since(started));
    return result;
}

TaskRunner::StageOutcome TaskRunner::execute_stage(const TaskStage& stage, bool is_target,
                                                   NetworkProvisioner& network, const RunContext& context) {
    const auto started = std::chrono::steady_clock::now();
    const TaskConfig& task = *config_.find_task(stage.task);
    StageOutcome outcome;

    LogUtils::info("Running task '{}'", task.name);
    if (!stage.main_container) {
        LogUtils::info("Task '{}' has nothing to run besides its prerequisites", task.name);
        if (is_target) {
            transition(RunState::TearingDown);
        }
        return outcome;
    }

    ResourceRegistry registry;
    ContainerLifecycleManager lifecycle(runtime_, registry, context);

    auto fail = [&outcome, &task](const std::exception& e, int exit_code) {
        LogUtils::error("Task '{}': {}", task.name, e.what());
        outcome.error = e.what();
        outcome.exit_code = exit_code;
    };

    try {
        validate_volumes(stage, is_target, context);

        const std::string network_id = network.ensure_network();
        if (is_target) {
            transition(RunState::ProvisioningDependencies);
        }
        provision_dependencies(stage, lifecycle, network_id);

        if (cancelled()) {
            throw OperationCancelledError("Interrupted before task '" + task.name + "' started");
        }
        if (is_target) {
            transition(RunState::RunningMainTask);
        }
        outcome.exit_code = run_main_container(task, is_target, lifecycle, network_id);
    } catch (const OperationCancelledError& e) {
        fail(e, cancelled() ? INTERRUPTED_EXIT_CODE : ORCHESTRATION_FAILURE_EXIT_CODE);
    } catch (const std::exception& e) {
        // Volume, lifecycle and runtime errors alike
        fail(e, ORCHESTRATION_FAILURE_EXIT_CODE);
    }

    if (is_target) {
        transition(RunState::TearingDown);
    }
    if (!registry.empty()) {
        LogUtils::debug("Cleaning up {} container(s) of task '{}'", registry.size(), task.name);
    }
    try {
        lifecycle.remove_all(config_.global.stop_timeout);
    } catch (const CleanupError& e) {
        outcome.cleanup_errors = e.failures();
    }

    if (!outcome.error) {
        LogUtils::info("Task '{}' exited with code {} ({:.1f}s)", task.name, outcome.exit_code, seconds_since(started));
    }
    return outcome;
}

void TaskRunner::validate_volumes(const TaskStage& stage, bool is_target, const RunContext& context) const {
    VolumeResolver resolver(runtime_, context);
    for (const auto& startup : stage.dependencies) {
        resolver.resolve(*config_.find_container(startup.container));
    }
    resolver.resolve(main_container_config(*config_.find_task(stage.task), is_target));
}

void TaskRunner::provision_dependencies(const TaskStage& stage, ContainerLifecycleManager& lifecycle,
                                        const std::string& network_id) {
    if (stage.dependencies.empty()) return;

    DependencyStarter starter(stage.dependencies, config_.global.concurrency);
    auto should_stop = [this, &starter] { return cancelled() || starter.has_failure(); };

    starter.run([&](const DependencyStartup& startup) {
        if (should_stop()) {
            throw OperationCancelledError("Not starting '" + startup.container + "'");
        }
        const ContainerConfig& container = *config_.find_container(startup.container);

        LogUtils::info("Starting dependency '{}'", container.name);
        ContainerHandle handle = lifecycle.create(container, network_id);
        // Pulls and builds can take long enough to span an interrupt
        if (should_stop()) {
            throw OperationCancelledError("Not starting '" + startup.container + "'");
        }
        lifecycle.start(handle);
        lifecycle.await_ready(handle, readiness_, should_stop);
        LogUtils::info("Dependency '{}' is ready", container.name);
    });
}

ContainerConfig TaskRunner::main_container_config(const TaskConfig& task, bool is_target) const {
    const TaskRunConfig& run = *task.run;
    ContainerConfig container = *config_.find_container(run.container);

    if (run.command) {
        container.command = run.command;
    }
    if (is_target && !config_.global.extra_args.empty()) {
        const Command base = container.command ? *container.command : Command();
        container.command = base.with_extra_args(config_.global.extra_args);
    }
    if (run.entrypoint) {
        container.entrypoint = run.entrypoint;
    }
    for (const auto& [key, value] : run.environment) {
        container.environment[key] = value;
    }
    container.ports.insert(container.ports.end(), run.ports.begin(), run.ports.end());
    if (run.working_directory) {
        container.working_directory = run.working_directory;
    }
    return container;
}

int TaskRunner::run_main_container(const TaskConfig& task, bool is_target, ContainerLifecycleManager& lifecycle,
                                   const std::string& network_id) {
    const ContainerConfig container = main_container_config(task, is_target);
    const ContainerHandle handle = lifecycle.create(container, network_id);
    if (cancelled()) {
        throw OperationCancelledError("Interrupted before task '" + task.name + "' started");
    }
    lifecycle.start(handle);

    std::thread output([this, &handle] {
        try {
            runtime_.stream_container_output(handle.id, on_stdout_, on_stderr_);
        } catch (const std::exception& e) {
            LogUtils::warn("Output of '{}' is unavailable: {}", handle.name, e.what());
        }
    });

    auto exit_future = std::async(std::launch::async, [this, &handle] {
        return runtime_.wait_container_exit(handle.id);
    });

    bool interrupted = false;
    while (exit_future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (cancelled()) {
            interrupted = true;
            break;
        }
    }

    int exit_code = 0;
    std::optional<std::string> wait_error;
    if (!interrupted) {
        try {
            exit_code = exit_future.get();
        } catch (const ContainerRuntimeError& e) {
            wait_error = e.what();
        }
    }

    if (interrupted || wait_error) {
        LogUtils::warn("Stopping task '{}'", task.name);
        try {
            lifecycle.stop(handle, config_.global.stop_timeout);
        } catch (const ContainerLifecycleError& e) {
            LogUtils::warn("{}, removing it", e.what());
            try {
                lifecycle.remove(handle);
            } catch (const ContainerLifecycleError& remove_error) {
                LogUtils::error("{}", remove_error.what());
            }
        }
        if (interrupted) {
            exit_future.wait();
        }
    }
    output.join();

    // An interrupt racing the container's exit still ends the run as interrupted
    if (interrupted || cancelled()) {
        throw OperationCancelledError("Task '" + task.name + "' was interrupted");
    }
    if (wait_error) {
        throw ContainerLifecycleError(handle.name, *wait_error);
    }
    return exit_code;
}
