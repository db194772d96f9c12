#pragma once

#include "ContainerRuntimeTypes.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <string>

// Capabilities the orchestration core needs from a container engine. Every
// method may be called concurrently; failures raise ContainerRuntimeError.
class IContainerRuntime {
public:
    using OutputCallback = std::function<void(const std::string& chunk)>;

    virtual ~IContainerRuntime() = default;

    // Returns the network id
    virtual std::string create_network(const std::string& name,
                                       const std::map<std::string, std::string>& labels) = 0;
    virtual void remove_network(const std::string& network_id) = 0;

    virtual void pull_image_if_absent(const std::string& image) = 0;
    // Returns the image reference to create containers from
    virtual std::string build_image(const ImageBuildRequest& request) = 0;
    // Creates the named volume unless it already exists
    virtual void ensure_volume(const std::string& name) = 0;

    // Returns the container id
    virtual std::string create_container(const ContainerCreateRequest& request) = 0;
    virtual void start_container(const std::string& container_id) = 0;
    virtual ContainerHealth inspect_container_health(const std::string& container_id) = 0;

    // Blocks until the container's output ends
    virtual void stream_container_output(const std::string& container_id,
                                         const OutputCallback& on_stdout,
                                         const OutputCallback& on_stderr) = 0;
    // Blocks until the container exits and returns its exit code
    virtual int wait_container_exit(const std::string& container_id) = 0;

    virtual void stop_container(const std::string& container_id, std::chrono::seconds timeout) = 0;
    // Force-removes the container; removing an already absent container succeeds
    virtual void remove_container(const std::string& container_id) = 0;
};
