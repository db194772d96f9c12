#pragma once

#include "ContainerConfig.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// A failed call into the container runtime, carrying the runtime's own diagnostics
class ContainerRuntimeError : public std::runtime_error {
public:
    ContainerRuntimeError(const std::string& message, const std::string& detail = "")
        : std::runtime_error(detail.empty() ? message : message + ": " + detail),
          detail_(detail) {}

    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

// A concrete mount handed to the runtime
struct MountSpec {
    enum class Kind {
        Bind,       // host path
        Volume      // named volume
    };

    Kind kind = Kind::Bind;
    std::string source;
    std::string target;
    std::optional<std::string> options;

    std::string to_docker_arg() const {
        std::string arg = source + ":" + target;
        if (options) {
            arg += ":" + *options;
        }
        return arg;
    }

    bool operator==(const MountSpec& other) const {
        return kind == other.kind && source == other.source && target == other.target && options == other.options;
    }
};

struct ContainerCreateRequest {
    std::string name;                          // unique runtime name
    std::string image;
    std::string network;
    std::string network_alias;                 // DNS name on the network
    std::vector<std::string> command;          // empty: image default
    std::optional<std::string> entrypoint;
    std::map<std::string, std::string> environment;
    std::optional<std::string> working_directory;
    std::vector<MountSpec> mounts;
    std::vector<PortMapping> ports;
    HealthCheckConfig health_check;
    std::map<std::string, std::string> labels;
};

struct ImageBuildRequest {
    std::string context_directory;
    std::optional<std::string> dockerfile;
    std::string tag;
};

enum class ContainerStatus {
    Created,
    Running,
    Exited,
    Unknown
};

enum class HealthStatus {
    None,           // no health check configured on the container or its image
    Starting,
    Healthy,
    Unhealthy
};

struct ContainerHealth {
    ContainerStatus status = ContainerStatus::Unknown;
    HealthStatus health = HealthStatus::None;
    int exit_code = 0;
    std::string last_health_output;
};

const char* to_string(ContainerStatus status);
const char* to_string(HealthStatus health);
