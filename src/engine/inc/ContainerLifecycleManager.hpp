#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "ContainerConfig.hpp"
#include "IContainerRuntime.hpp"
#include "ResourceRegistry.hpp"
#include "RunContext.hpp"
#include "VolumeResolver.hpp"

struct ReadinessPolicy {
    std::chrono::milliseconds timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds poll_interval{500};
};

// Creates, starts, watches and removes the containers of one task execution.
// Every created container is registered before create() returns so that
// remove_all() can always find it.
class ContainerLifecycleManager {
public:
    // Returns true when waiting should be abandoned
    using StopPredicate = std::function<bool()>;

    ContainerLifecycleManager(IContainerRuntime& runtime, ResourceRegistry& registry, const RunContext& context);

    ContainerLifecycleManager(const ContainerLifecycleManager&) = delete;
    ContainerLifecycleManager& operator=(const ContainerLifecycleManager&) = delete;

    // Prepares the image and volumes, then creates the container on the network
    ContainerHandle create(const ContainerConfig& container, const std::string& network_id);

    void start(const ContainerHandle& handle);

    // Blocks until the container is ready: running without a health check, or healthy
    void await_ready(const ContainerHandle& handle, const ReadinessPolicy& policy, const StopPredicate& should_stop);

    void stop(const ContainerHandle& handle, std::chrono::seconds timeout);
    void remove(const ContainerHandle& handle);

    // Stops and removes every registered container in reverse creation order.
    // Keeps going past failures and reports them together as a CleanupError.
    void remove_all(std::chrono::seconds stop_timeout);

    ResourceRegistry& registry() { return registry_; }

private:
    std::string prepare_image(const ContainerConfig& container);

    IContainerRuntime& runtime_;
    ResourceRegistry& registry_;
    const RunContext& context_;
    VolumeResolver volumes_;
};
