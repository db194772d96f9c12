#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <filesystem>
#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when the invocation was fully handled (help or version shown)
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config, const std::filesystem::path& config_dir);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;

private:
    ConfigData config_data; // Top-level config data

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> positional_args;
    std::vector<std::string> passthrough_args;

    void parse_project_name(const YAML::Node& config, const std::filesystem::path& config_dir);
    void parse_containers(const YAML::Node& containers_node);
    void parse_tasks(const YAML::Node& tasks_node);
    void validate_required_arguments() const;

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--config-file")
        char short_opt;          // Short option (e.g. 'f')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
