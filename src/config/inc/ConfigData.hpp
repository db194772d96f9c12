#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "GlobalConfig.hpp"
#include "ContainerConfig.hpp"
#include "TaskConfig.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    std::string project_name;
    std::filesystem::path config_dir;              // directory holding the config file
    std::vector<ContainerConfig> containers;       // declaration order
    std::vector<TaskConfig> tasks;                 // declaration order

    const ContainerConfig* find_container(const std::string& name) const;
    const TaskConfig* find_task(const std::string& name) const;
};
