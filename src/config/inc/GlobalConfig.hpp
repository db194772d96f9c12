#pragma once

#include <chrono>
#include <string>
#include <vector>

struct GlobalConfig {
    bool verbose = false;
    bool list_tasks = false;
    bool skip_prerequisites = false;
    std::string config_file = "taskbox.yml";
    std::string log_file = ".taskbox/logs/taskbox.log";
    std::string docker_binary = "docker";
    size_t concurrency = 8;                                     // dependency startup workers
    std::chrono::milliseconds readiness_timeout{std::chrono::minutes(5)};
    std::chrono::seconds stop_timeout{10};

    std::string task_name;                                      // positional argument
    std::vector<std::string> extra_args;                        // everything after "--"
};
