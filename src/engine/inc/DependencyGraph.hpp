#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "ConfigData.hpp"

// Graph node for a task or a container definition
struct GraphNode {
    enum class Kind {
        Task,
        Container
    };

    Kind kind = Kind::Task;
    std::string name;
    std::vector<GraphNode*> predecessors;   // must run / be available before this node, declaration order
    std::vector<GraphNode*> successors;     // nodes waiting on this one
};

// Directed graph over every task and container of a configuration. Construction
// validates the whole configuration: unknown references, a task depending on its
// own run container, and cycles among prerequisites or container dependencies.
class DependencyGraph {
public:
    explicit DependencyGraph(const ConfigData& config);

    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    // Throws UnknownReferenceError when no such task exists
    const GraphNode& task(const std::string& name) const;
    const GraphNode& container(const std::string& name) const;

    bool has_task(const std::string& name) const;

    // Prerequisite task nodes of a task, declaration order
    std::vector<const GraphNode*> prerequisites_of(const std::string& task_name) const;

    // Containers reachable from `roots` through container dependencies, each
    // listed after everything it depends on; ties follow declaration order
    std::vector<const GraphNode*> container_closure(const std::vector<std::string>& roots) const;

    const ConfigData& config() const { return config_; }

private:
    GraphNode* add_node(GraphNode::Kind kind, const std::string& name);
    static void add_edge(GraphNode* from, GraphNode* to);

    void build_edges();
    void check_run_containers() const;
    void check_cycles() const;

    const ConfigData& config_;
    std::unordered_map<std::string, GraphNode*> tasks_;
    std::unordered_map<std::string, GraphNode*> containers_;
    std::vector<std::unique_ptr<GraphNode>> nodes_;         // declaration order, containers first
};
