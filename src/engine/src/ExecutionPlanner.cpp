#include "ExecutionPlanner.hpp"
#include <algorithm>

std::vector<std::string> RunPlan::task_order() const {
    std::vector<std::string> order;
    order.reserve(stages.size());
    for (const auto& stage : stages) {
        order.push_back(stage.task);
    }
    return order;
}

std::string RunPlan::describe() const {
    std::string text;
    for (size_t i = 0; i < stages.size(); ++i) {
        const auto& stage = stages[i];
        text += std::to_string(i + 1) + ". " + stage.task;

        if (!stage.dependencies.empty()) {
            text += " (dependencies:";
            for (const auto& dependency : stage.dependencies) {
                text += " " + dependency.container;
            }
            text += ")";
        }
        if (stage.main_container) {
            text += " in " + *stage.main_container;
        }
        if (i + 1 < stages.size()) {
            text += "\n";
        }
    }
    return text;
}

ExecutionPlanner::ExecutionPlanner(const DependencyGraph& graph) : graph_(graph) {}

void ExecutionPlanner::collect_prerequisites(const GraphNode& task,
                                             std::vector<std::string>& order,
                                             std::vector<std::string>& visited) const {
    if (std::find(visited.begin(), visited.end(), task.name) != visited.end()) return;
    visited.push_back(task.name);

    for (const GraphNode* prerequisite : graph_.prerequisites_of(task.name)) {
        collect_prerequisites(*prerequisite, order, visited);
    }
    order.push_back(task.name);
}

RunPlan ExecutionPlanner::plan(const std::string& target, bool skip_prerequisites) const {
    const GraphNode& target_node = graph_.task(target);

    std::vector<std::string> order;
    if (skip_prerequisites) {
        order.push_back(target);
    } else {
        std::vector<std::string> visited;
        collect_prerequisites(target_node, order, visited);
    }

    RunPlan plan;
    plan.target = target;
    for (const auto& name : order) {
        plan.stages.push_back(plan_stage(name));
    }
    return plan;
}

TaskStage ExecutionPlanner::plan_stage(const std::string& task_name) const {
    graph_.task(task_name);     // throws for unknown tasks
    const TaskConfig* task = graph_.config().find_task(task_name);

    TaskStage stage;
    stage.task = task_name;
    if (!task->run) {
        return stage;
    }
    stage.main_container = task->run->container;

    std::vector<std::string> roots = task->dependencies;
    const auto& run_dependencies = graph_.container(task->run->container).predecessors;
    for (const GraphNode* node : run_dependencies) {
        roots.push_back(node->name);
    }

    for (const GraphNode* node : graph_.container_closure(roots)) {
        DependencyStartup startup;
        startup.container = node->name;
        for (const GraphNode* dependency : node->predecessors) {
            startup.depends_on.push_back(dependency->name);
        }
        stage.dependencies.push_back(std::move(startup));
    }
    return stage;
}
