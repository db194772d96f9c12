#pragma once

#include <optional>
#include <string>
#include <vector>

#include "DependencyGraph.hpp"

// A dependency container to start within one stage
struct DependencyStartup {
    std::string container;
    std::vector<std::string> depends_on;     // containers of the same stage that must be ready first

    bool operator==(const DependencyStartup& other) const {
        return container == other.container && depends_on == other.depends_on;
    }
    bool operator!=(const DependencyStartup& other) const { return !(*this == other); }
};

// One task execution: dependency startup followed by the task's own container
struct TaskStage {
    std::string task;
    std::vector<DependencyStartup> dependencies;    // each listed after what it waits for
    std::optional<std::string> main_container;      // absent when the task only has prerequisites

    bool operator==(const TaskStage& other) const {
        return task == other.task && dependencies == other.dependencies && main_container == other.main_container;
    }
    bool operator!=(const TaskStage& other) const { return !(*this == other); }
};

struct RunPlan {
    std::string target;
    std::vector<TaskStage> stages;      // prerequisites in execution order, target last

    const TaskStage& target_stage() const { return stages.back(); }

    std::vector<std::string> task_order() const;
    std::string describe() const;

    bool operator==(const RunPlan& other) const {
        return target == other.target && stages == other.stages;
    }
    bool operator!=(const RunPlan& other) const { return !(*this == other); }
};

class ExecutionPlanner {
public:
    explicit ExecutionPlanner(const DependencyGraph& graph);

    RunPlan plan(const std::string& target, bool skip_prerequisites = false) const;

    TaskStage plan_stage(const std::string& task_name) const;

private:
    void collect_prerequisites(const GraphNode& task,
                               std::vector<std::string>& order,
                               std::vector<std::string>& visited) const;

    const DependencyGraph& graph_;
};
