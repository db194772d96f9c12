#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "CancellationToken.hpp"
#include "ConfigData.hpp"
#include "ContainerLifecycleManager.hpp"
#include "ExecutionPlanner.hpp"
#include "IContainerRuntime.hpp"
#include "NetworkProvisioner.hpp"

enum class RunState {
    Planning,
    RunningPrerequisites,
    ProvisioningDependencies,
    RunningMainTask,
    TearingDown,
    Completed,
    Failed
};

const char* to_string(RunState state);

struct TaskResult {
    std::string task_name;
    RunState final_state = RunState::Failed;
    int exit_code = 0;
    std::optional<std::string> error;               // orchestration failure summary
    std::vector<std::string> cleanup_errors;        // resources that could not be removed
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return final_state == RunState::Completed; }
};

// Drives one top-level invocation: plans it, runs each prerequisite stage to
// completion, provisions the target's dependencies, runs its container and
// always tears everything down again. Failures end up in the TaskResult.
class TaskRunner {
public:
    using OutputCallback = IContainerRuntime::OutputCallback;

    static constexpr int ORCHESTRATION_FAILURE_EXIT_CODE = 255;
    static constexpr int INTERRUPTED_EXIT_CODE = 130;

    TaskRunner(const ConfigData& config, IContainerRuntime& runtime, const CancellationToken& cancellation);

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    // Where the main containers' output goes; stdout/stderr by default
    void set_output(OutputCallback on_stdout, OutputCallback on_stderr);

    void set_readiness_policy(const ReadinessPolicy& policy) { readiness_ = policy; }

    TaskResult run(const std::string& task_name);

    RunState state() const { return state_.load(); }

    // States visited by the last run()
    const std::vector<RunState>& history() const { return history_; }

private:
    struct StageOutcome {
        int exit_code = 0;
        std::optional<std::string> error;
        std::vector<std::string> cleanup_errors;

        bool ok() const { return exit_code == 0 && !error; }
    };

    StageOutcome execute_stage(const TaskStage& stage, bool is_target,
                               NetworkProvisioner& network, const RunContext& context);

    void provision_dependencies(const TaskStage& stage, ContainerLifecycleManager& lifecycle,
                                const std::string& network_id);

    int run_main_container(const TaskConfig& task, bool is_target, ContainerLifecycleManager& lifecycle,
                           const std::string& network_id);

    // The task's container with the task's run overrides applied
    ContainerConfig main_container_config(const TaskConfig& task, bool is_target) const;

    void validate_volumes(const TaskStage& stage, bool is_target, const RunContext& context) const;

    TaskResult finish(TaskResult result, RunState final_state, std::chrono::steady_clock::time_point started);

    void transition(RunState next);
    bool cancelled() const { return cancellation_.is_cancelled(); }

    const ConfigData& config_;
    IContainerRuntime& runtime_;
    const CancellationToken& cancellation_;
    ReadinessPolicy readiness_;

    OutputCallback on_stdout_;
    OutputCallback on_stderr_;

    std::atomic<RunState> state_{RunState::Planning};
    std::vector<RunState> history_;
};
