#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "IContainerRuntime.hpp"
#include "RunContext.hpp"

// Owns the single network of an invocation. The network is created on first
// demand and shared by every stage until remove_network().
class NetworkProvisioner {
public:
    NetworkProvisioner(IContainerRuntime& runtime, const RunContext& context);

    NetworkProvisioner(const NetworkProvisioner&) = delete;
    NetworkProvisioner& operator=(const NetworkProvisioner&) = delete;

    // Returns the network id; throws ContainerRuntimeError when creation fails
    std::string ensure_network();

    bool has_network() const;

    // Throws CleanupError when the runtime refuses
    void remove_network();

private:
    IContainerRuntime& runtime_;
    const RunContext& context_;

    mutable std::mutex mutex_;
    std::optional<std::string> network_id_;
};
