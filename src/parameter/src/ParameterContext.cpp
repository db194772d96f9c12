#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <stdexcept>

#ifndef TASKBOX_VERSION
#define TASKBOX_VERSION "0.0.0-dev"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'f', "Config file to load (default: taskbox.yml)", true},
    {"--list-tasks", 'T', "List all tasks defined in the config file", false},
    {"--skip-prerequisites", 's', "Run only the given task, not its prerequisites", false},
    {"--concurrency", 'j', "Maximum number of dependency containers started in parallel", true},
    {"--docker-binary", 'd', "Docker CLI to invoke (default: docker)", true},
    {"--log-file", 'l', "Write the detailed log to this file", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: taskbox [OPTIONS]... TASK [-- ARGS...]\n\n"
              << "Runs TASK from the config file inside Docker containers. ARGS are\n"
              << "appended to the task's command.\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  TASKBOX_CONFIG_FILE, TASKBOX_DOCKER_BINARY, TASKBOX_LOG_FILE\n"
              << "\nExamples:\n"
              << "  taskbox --list-tasks\n"
              << "  taskbox build\n"
              << "  taskbox -f ci/taskbox.yml test -- --tests 'com.example.*'\n\n";
}

void ParameterContext::show_version() {
    std::cout << "taskbox version: " << TASKBOX_VERSION << std::endl;
}

void ParameterContext::parse_project_name(const YAML::Node& config, const std::filesystem::path& config_dir) {
    std::string name;
    if (config["project_name"]) {
        name = config["project_name"].as<std::string>();
        if (!StringUtils::is_valid_docker_name(name) || name != StringUtils::to_lower(name)) {
            throw ConfigError("Invalid project_name '" + name + "': use lowercase letters, digits, '_', '.' or '-'");
        }
    } else {
        name = StringUtils::sanitize_name(std::filesystem::absolute(config_dir).filename().string());
        if (name.empty()) {
            name = "taskbox";
        }
    }
    config_data.project_name = name;
}

void ParameterContext::parse_containers(const YAML::Node& containers_yaml) {
    if (!containers_yaml.IsMap()) {
        throw ConfigError("'containers' must be a mapping of container names to definitions");
    }

    std::set<std::string> seen;
    for (const auto& container_node : containers_yaml) {
        const auto name = container_node.first.as<std::string>();
        if (!seen.insert(name).second) {
            throw ConfigError("Duplicate container name: " + name);
        }
        if (!StringUtils::is_valid_docker_name(name)) {
            throw ConfigError("Invalid container name '" + name + "'");
        }

        ContainerConfig container;
        try {
            container = container_node.second.as<ContainerConfig>();
        } catch (const ConfigError& e) {
            throw ConfigError("Container '" + name + "': " + e.what());
        }
        container.name = name;
        config_data.containers.push_back(container);
    }
}

void ParameterContext::parse_tasks(const YAML::Node& tasks_yaml) {
    if (!tasks_yaml.IsMap()) {
        throw ConfigError("'tasks' must be a mapping of task names to definitions");
    }

    std::set<std::string> seen;
    for (const auto& task_node : tasks_yaml) {
        const auto name = task_node.first.as<std::string>();
        if (!seen.insert(name).second) {
            throw ConfigError("Duplicate task name: " + name);
        }
        if (name.empty() || StringUtils::starts_with(name, "-")) {
            throw ConfigError("Invalid task name '" + name + "'");
        }

        TaskConfig task;
        try {
            task = task_node.second.as<TaskConfig>();
        } catch (const ConfigError& e) {
            throw ConfigError("Task '" + name + "': " + e.what());
        }
        task.name = name;
        config_data.tasks.push_back(task);
    }
}

void ParameterContext::merge_yaml(const YAML::Node& config, const std::filesystem::path& config_dir) {
    static const std::set<std::string> valid_keys = {"project_name", "containers", "tasks"};
    YAML::check_unknown_keys(config, valid_keys, "config file");

    config_data.config_dir = config_dir;
    parse_project_name(config, config_dir);

    if (config["containers"]) {
        parse_containers(config["containers"]);
    }

    if (config["tasks"]) {
        parse_tasks(config["tasks"]);
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    if (!std::filesystem::exists(file_path)) {
        throw ConfigError("Config file '" + file_path + "' does not exist");
    }

    const auto config_dir = std::filesystem::absolute(file_path).parent_path();
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        if (config.IsNull()) {
            throw ConfigError("Config file is empty");
        }
        merge_yaml(config, config_dir);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError("Invalid config file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    merge_yaml(config_data.global.config_file);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Everything after "--" belongs to the task's command
        if (arg == "--") {
            for (++i; i < argc; ++i) {
                passthrough_args.emplace_back(argv[i]);
            }
            break;
        }

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw ConfigError("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw ConfigError("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw ConfigError("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw ConfigError("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw ConfigError("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw ConfigError("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        else {
            positional_args.push_back(arg);
        }
    }

    if (positional_args.size() > 1) {
        throw ConfigError("Too many arguments: expected a single task name, got '" +
                          StringUtils::join(positional_args, "', '") +
                          "'. Pass task arguments after '--'");
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& global = config_data.global;

    if (cli_params.count("--config-file")) {
        global.config_file = cli_params["--config-file"];
    }
    if (cli_params.count("--log-file")) {
        global.log_file = cli_params["--log-file"];
    }
    if (cli_params.count("--docker-binary")) {
        global.docker_binary = cli_params["--docker-binary"];
    }
    if (cli_params.count("--concurrency")) {
        try {
            size_t consumed = 0;
            const int concurrency = std::stoi(cli_params["--concurrency"], &consumed);
            if (consumed != cli_params["--concurrency"].size() || concurrency < 1) {
                throw std::invalid_argument("concurrency");
            }
            global.concurrency = static_cast<size_t>(concurrency);
        } catch (const std::logic_error&) {
            throw ConfigError("Invalid concurrency: " + cli_params["--concurrency"]);
        }
    }
    if (cli_params.count("--verbose")) {
        global.verbose = true;
    }
    if (cli_params.count("--list-tasks")) {
        global.list_tasks = true;
    }
    if (cli_params.count("--skip-prerequisites")) {
        global.skip_prerequisites = true;
    }

    if (!positional_args.empty()) {
        global.task_name = positional_args.front();
    }
    global.extra_args = passthrough_args;
}

void ParameterContext::merge_environment_vars() {
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"TASKBOX_CONFIG_FILE", "config_file"},
        {"TASKBOX_DOCKER_BINARY", "docker_binary"},
        {"TASKBOX_LOG_FILE", "log_file"}
    };

    auto& global = config_data.global;
    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && env_value[0] != '\0') {
            if (key == "config_file") {
                global.config_file = env_value;
            } else if (key == "docker_binary") {
                global.docker_binary = env_value;
            } else if (key == "log_file") {
                global.log_file = env_value;
            }
        }
    }
}

void ParameterContext::validate_required_arguments() const {
    const auto& global = config_data.global;
    if (global.list_tasks) {
        if (!global.task_name.empty()) {
            throw ConfigError("--list-tasks does not take a task name");
        }
        return;
    }
    if (global.task_name.empty()) {
        throw ConfigError("No task given. Use --list-tasks to see the available tasks");
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_environment_vars();
    merge_commandline();
    validate_required_arguments();
    merge_yaml();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}
