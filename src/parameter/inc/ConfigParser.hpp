#pragma once

#include "ConfigData.hpp"
#include "ConfigError.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>
#include <optional>

#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigError("Expected a mapping in " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw ConfigError("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    inline std::vector<std::string> parse_name_list(const YAML::Node& node, const std::string& context) {
        if (!node.IsSequence()) {
            throw ConfigError("Expected a list of names in " + context);
        }
        std::vector<std::string> names;
        std::set<std::string> seen;
        for (const auto& item : node) {
            auto name = item.as<std::string>();
            if (!seen.insert(name).second) {
                throw ConfigError("Duplicate entry '" + name + "' in " + context);
            }
            names.push_back(name);
        }
        return names;
    }

    inline std::map<std::string, std::string> parse_environment(const YAML::Node& node, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigError("Expected a mapping of variables in " + context);
        }
        std::map<std::string, std::string> env;
        for (auto it = node.begin(); it != node.end(); ++it) {
            const auto key = it->first.as<std::string>();
            if (key.empty() || key.find('=') != std::string::npos) {
                throw ConfigError("Invalid environment variable name '" + key + "' in " + context);
            }
            env[key] = it->second.IsNull() ? std::string() : it->second.as<std::string>();
        }
        return env;
    }

    template<>
    struct convert<Command> {
        static bool decode(const Node& node, Command& rhs) {
            if (!node.IsScalar()) {
                throw ConfigError("Command must be a string");
            }
            rhs = Command(node.as<std::string>());
            return true;
        }
    };

    template<>
    struct convert<PortMapping> {
        static bool decode(const Node& node, PortMapping& rhs) {
            if (node.IsScalar()) {
                rhs = PortMapping::parse(node.as<std::string>());
                return true;
            }

            static const std::set<std::string> valid_keys = {"local", "container", "protocol"};
            check_unknown_keys(node, valid_keys, "ports");

            if (!node["local"] || !node["container"]) {
                throw ConfigError("Port mapping requires both 'local' and 'container'");
            }
            rhs.local_port = node["local"].as<int>();
            rhs.container_port = node["container"].as<int>();
            if (node["protocol"]) {
                rhs = PortMapping::parse(std::to_string(rhs.local_port) + ":" + std::to_string(rhs.container_port) +
                                         "/" + node["protocol"].as<std::string>());
            }
            PortMapping::validate_port(rhs.local_port, "ports::local");
            PortMapping::validate_port(rhs.container_port, "ports::container");
            return true;
        }
    };

    template<>
    struct convert<VolumeMount> {
        static bool decode(const Node& node, VolumeMount& rhs) {
            if (node.IsScalar()) {
                rhs = VolumeMount::parse(node.as<std::string>());
                return true;
            }

            static const std::set<std::string> valid_keys = {"type", "local", "name", "container", "options"};
            check_unknown_keys(node, valid_keys, "volumes");

            const std::string type = node["type"] ? node["type"].as<std::string>() : "local";
            if (!node["container"]) {
                throw ConfigError("Missing required field 'container' in volume mount");
            }
            rhs.container_path = node["container"].as<std::string>();
            if (node["options"]) {
                rhs.options = node["options"].as<std::string>();
            }

            if (type == "local") {
                if (!node["local"]) {
                    throw ConfigError("Missing required field 'local' in local volume mount");
                }
                if (node["name"]) {
                    throw ConfigError("Field 'name' is only valid for cache volume mounts");
                }
                rhs.type = VolumeMount::Type::Local;
                rhs.local_path = node["local"].as<std::string>();
            } else if (type == "cache") {
                if (!node["name"]) {
                    throw ConfigError("Missing required field 'name' in cache volume mount");
                }
                if (node["local"]) {
                    throw ConfigError("Field 'local' is only valid for local volume mounts");
                }
                rhs.type = VolumeMount::Type::Cache;
                rhs.cache_name = node["name"].as<std::string>();
            } else {
                throw ConfigError("Invalid volume mount type: " + type + " (expected 'local' or 'cache')");
            }
            return true;
        }
    };

    template<>
    struct convert<HealthCheckConfig> {
        static bool decode(const Node& node, HealthCheckConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "command", "interval", "timeout", "start_period", "retries"
            };
            check_unknown_keys(node, valid_keys, "health_check");

            if (node["command"]) rhs.command = node["command"].as<Command>();
            if (node["interval"]) rhs.interval = HealthCheckConfig::parse_duration(node["interval"].as<std::string>());
            if (node["timeout"]) rhs.timeout = HealthCheckConfig::parse_duration(node["timeout"].as<std::string>());
            if (node["start_period"]) rhs.start_period = HealthCheckConfig::parse_duration(node["start_period"].as<std::string>());
            if (node["retries"]) {
                rhs.retries = node["retries"].as<int>();
                if (*rhs.retries < 0) {
                    throw ConfigError("health_check::retries must not be negative");
                }
            }
            return true;
        }
    };

    // The container name is the mapping key and is filled in by the caller
    template<>
    struct convert<ContainerConfig> {
        static bool decode(const Node& node, ContainerConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "image", "build_directory", "dockerfile", "command", "entrypoint", "environment",
                "working_directory", "volumes", "ports", "dependencies", "health_check"
            };
            check_unknown_keys(node, valid_keys, "containers");

            if (node["image"]) {
                rhs.image = node["image"].as<std::string>();
            }
            if (node["build_directory"]) {
                rhs.build_directory = node["build_directory"].as<std::string>();
            }
            if (rhs.image.has_value() == rhs.build_directory.has_value()) {
                throw ConfigError("Exactly one of 'image' or 'build_directory' must be set");
            }
            if (node["dockerfile"]) {
                if (!rhs.build_directory) {
                    throw ConfigError("'dockerfile' requires 'build_directory'");
                }
                rhs.dockerfile = node["dockerfile"].as<std::string>();
            }

            if (node["command"]) rhs.command = node["command"].as<Command>();
            if (node["entrypoint"]) rhs.entrypoint = node["entrypoint"].as<std::string>();
            if (node["environment"]) rhs.environment = parse_environment(node["environment"], "containers::environment");
            if (node["working_directory"]) rhs.working_directory = node["working_directory"].as<std::string>();
            if (node["volumes"]) rhs.volumes = node["volumes"].as<std::vector<VolumeMount>>();
            if (node["ports"]) rhs.ports = node["ports"].as<std::vector<PortMapping>>();
            if (node["dependencies"]) rhs.dependencies = parse_name_list(node["dependencies"], "containers::dependencies");
            if (node["health_check"]) rhs.health_check = node["health_check"].as<HealthCheckConfig>();
            return true;
        }
    };

    template<>
    struct convert<TaskRunConfig> {
        static bool decode(const Node& node, TaskRunConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "container", "command", "entrypoint", "environment", "ports", "working_directory"
            };
            check_unknown_keys(node, valid_keys, "tasks::run");

            if (node["container"]) {
                rhs.container = node["container"].as<std::string>();
            } else {
                throw ConfigError("Missing required field 'container' in tasks::run");
            }

            if (node["command"]) rhs.command = node["command"].as<Command>();
            if (node["entrypoint"]) rhs.entrypoint = node["entrypoint"].as<std::string>();
            if (node["environment"]) rhs.environment = parse_environment(node["environment"], "tasks::run::environment");
            if (node["ports"]) rhs.ports = node["ports"].as<std::vector<PortMapping>>();
            if (node["working_directory"]) rhs.working_directory = node["working_directory"].as<std::string>();
            return true;
        }
    };

    // The task name is the mapping key and is filled in by the caller
    template<>
    struct convert<TaskConfig> {
        static bool decode(const Node& node, TaskConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "description", "group", "run", "dependencies", "prerequisites"
            };
            check_unknown_keys(node, valid_keys, "tasks");

            if (node["description"]) rhs.description = node["description"].as<std::string>();
            if (node["group"]) rhs.group = node["group"].as<std::string>();
            if (node["run"]) rhs.run = node["run"].as<TaskRunConfig>();
            if (node["dependencies"]) rhs.dependencies = parse_name_list(node["dependencies"], "tasks::dependencies");
            if (node["prerequisites"]) rhs.prerequisites = parse_name_list(node["prerequisites"], "tasks::prerequisites");

            if (!rhs.run && rhs.prerequisites.empty()) {
                throw ConfigError("Task must define 'run', 'prerequisites', or both");
            }
            if (!rhs.run && !rhs.dependencies.empty()) {
                throw ConfigError("Task without 'run' cannot have 'dependencies'");
            }
            return true;
        }
    };

}
