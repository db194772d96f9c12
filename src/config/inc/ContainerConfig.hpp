#pragma once

#include "Command.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct HealthCheckConfig {
    std::optional<Command> command;
    std::optional<std::chrono::milliseconds> interval;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> start_period;
    std::optional<int> retries;

    bool is_configured() const {
        return command.has_value() || interval.has_value() || timeout.has_value() ||
               start_period.has_value() || retries.has_value();
    }

    // Accepts "1h", "2m", "30s", "500ms" and combinations such as "1m30s"
    static std::chrono::milliseconds parse_duration(const std::string& text);
    static std::string format_duration(std::chrono::milliseconds duration);
};

struct VolumeMount {
    enum class Type {
        Local,
        Cache
    };

    Type type = Type::Local;
    std::string local_path;                  // Local only, relative to the config file directory
    std::string cache_name;                  // Cache only
    std::string container_path;
    std::optional<std::string> options;      // e.g. "ro", "cached"

    // Short form "<local>:<container>[:<options>]"
    static VolumeMount parse(const std::string& text);

    std::string describe() const;
};

struct PortMapping {
    int local_port = 0;
    int container_port = 0;
    std::string protocol = "tcp";

    // Short form "<local>:<container>[/<protocol>]"
    static PortMapping parse(const std::string& text);
    static void validate_port(int port, const std::string& context);

    std::string to_docker_arg() const;
};

struct ContainerConfig {
    std::string name;

    std::optional<std::string> image;
    std::optional<std::string> build_directory;
    std::optional<std::string> dockerfile;

    std::optional<Command> command;
    std::optional<std::string> entrypoint;
    std::map<std::string, std::string> environment;
    std::optional<std::string> working_directory;
    std::vector<VolumeMount> volumes;
    std::vector<PortMapping> ports;
    std::vector<std::string> dependencies;
    HealthCheckConfig health_check;
};
