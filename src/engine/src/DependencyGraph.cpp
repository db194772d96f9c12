#include "DependencyGraph.hpp"
#include "OrchestrationErrors.hpp"
#include <algorithm>
#include <functional>
#include <unordered_set>

DependencyGraph::DependencyGraph(const ConfigData& config) : config_(config) {
    for (const auto& container : config.containers) {
        if (containers_.count(container.name)) {
            throw ConfigGraphError("Duplicate container name '" + container.name + "'");
        }
        containers_[container.name] = add_node(GraphNode::Kind::Container, container.name);
    }
    for (const auto& task : config.tasks) {
        if (tasks_.count(task.name)) {
            throw ConfigGraphError("Duplicate task name '" + task.name + "'");
        }
        tasks_[task.name] = add_node(GraphNode::Kind::Task, task.name);
    }

    build_edges();
    check_cycles();
    check_run_containers();
}

GraphNode* DependencyGraph::add_node(GraphNode::Kind kind, const std::string& name) {
    auto node = std::make_unique<GraphNode>();
    node->kind = kind;
    node->name = name;
    nodes_.push_back(std::move(node));
    return nodes_.back().get();
}

void DependencyGraph::add_edge(GraphNode* from, GraphNode* to) {
    from->predecessors.push_back(to);
    to->successors.push_back(from);
}

void DependencyGraph::build_edges() {
    auto lookup_container = [this](const std::string& name, const std::string& referenced_by) {
        auto it = containers_.find(name);
        if (it == containers_.end()) {
            throw UnknownReferenceError("container", name, referenced_by);
        }
        return it->second;
    };

    for (const auto& container : config_.containers) {
        GraphNode* node = containers_.at(container.name);
        for (const auto& dependency : container.dependencies) {
            add_edge(node, lookup_container(dependency, "Container '" + container.name + "'"));
        }
    }

    for (const auto& task : config_.tasks) {
        GraphNode* node = tasks_.at(task.name);
        const std::string referenced_by = "Task '" + task.name + "'";

        for (const auto& prerequisite : task.prerequisites) {
            auto it = tasks_.find(prerequisite);
            if (it == tasks_.end()) {
                throw UnknownReferenceError("task", prerequisite, referenced_by);
            }
            add_edge(node, it->second);
        }

        if (task.run) {
            add_edge(node, lookup_container(task.run->container, referenced_by));
        }

        for (const auto& dependency : task.dependencies) {
            add_edge(node, lookup_container(dependency, referenced_by));
        }
    }
}

void DependencyGraph::check_cycles() const {
    enum class Mark { Unvisited, InProgress, Done };
    std::unordered_map<const GraphNode*, Mark> marks;
    std::vector<const GraphNode*> path;

    std::function<void(const GraphNode*)> visit = [&](const GraphNode* node) {
        marks[node] = Mark::InProgress;
        path.push_back(node);

        for (const GraphNode* next : node->predecessors) {
            const Mark mark = marks.count(next) ? marks[next] : Mark::Unvisited;
            if (mark == Mark::InProgress) {
                auto start = std::find(path.begin(), path.end(), next);
                std::vector<std::string> cycle;
                for (auto it = start; it != path.end(); ++it) {
                    cycle.push_back((*it)->name);
                }
                cycle.push_back(next->name);
                throw CyclicDependencyError(std::move(cycle));
            }
            if (mark == Mark::Unvisited) {
                visit(next);
            }
        }

        path.pop_back();
        marks[node] = Mark::Done;
    };

    for (const auto& node : nodes_) {
        if (!marks.count(node.get())) {
            visit(node.get());
        }
    }
}

void DependencyGraph::check_run_containers() const {
    for (const auto& task : config_.tasks) {
        if (!task.run) continue;
        const std::string& own = task.run->container;

        if (std::find(task.dependencies.begin(), task.dependencies.end(), own) != task.dependencies.end()) {
            throw ConfigGraphError("Task '" + task.name + "' lists its own container '" + own + "' as a dependency");
        }

        std::vector<std::string> roots = task.dependencies;
        const auto& own_dependencies = config_.find_container(own)->dependencies;
        roots.insert(roots.end(), own_dependencies.begin(), own_dependencies.end());
        for (const GraphNode* node : container_closure(roots)) {
            if (node->name == own) {
                throw ConfigGraphError("Task '" + task.name + "' runs in container '" + own +
                                       "', which is also required by one of its dependencies");
            }
        }
    }
}

const GraphNode& DependencyGraph::task(const std::string& name) const {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        throw UnknownReferenceError("task", name, "");
    }
    return *it->second;
}

const GraphNode& DependencyGraph::container(const std::string& name) const {
    auto it = containers_.find(name);
    if (it == containers_.end()) {
        throw UnknownReferenceError("container", name, "");
    }
    return *it->second;
}

bool DependencyGraph::has_task(const std::string& name) const {
    return tasks_.count(name) > 0;
}

std::vector<const GraphNode*> DependencyGraph::prerequisites_of(const std::string& task_name) const {
    std::vector<const GraphNode*> result;
    for (const GraphNode* node : task(task_name).predecessors) {
        if (node->kind == GraphNode::Kind::Task) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<const GraphNode*> DependencyGraph::container_closure(const std::vector<std::string>& roots) const {
    std::vector<const GraphNode*> order;
    std::unordered_set<const GraphNode*> visited;

    std::function<void(const GraphNode*)> visit = [&](const GraphNode* node) {
        if (!visited.insert(node).second) return;
        for (const GraphNode* dependency : node->predecessors) {
            visit(dependency);
        }
        order.push_back(node);
    };

    for (const auto& root : roots) {
        visit(&container(root));
    }
    return order;
}
