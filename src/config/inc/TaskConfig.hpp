#pragma once

#include "Command.hpp"
#include "ContainerConfig.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// What a task runs and the overrides it applies to its container
struct TaskRunConfig {
    std::string container;
    std::optional<Command> command;
    std::optional<std::string> entrypoint;
    std::map<std::string, std::string> environment;
    std::vector<PortMapping> ports;
    std::optional<std::string> working_directory;
};

struct TaskConfig {
    std::string name;
    std::string description;
    std::string group;
    std::optional<TaskRunConfig> run;            // absent: the task only runs its prerequisites
    std::vector<std::string> dependencies;       // containers that must be ready first
    std::vector<std::string> prerequisites;      // tasks that must complete first
};
