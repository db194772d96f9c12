#pragma once

#include <vector>

#include "ContainerConfig.hpp"
#include "IContainerRuntime.hpp"
#include "RunContext.hpp"

// Maps configured volumes to concrete mounts. Local paths are resolved against
// the config file directory; caches become persistent named volumes.
class VolumeResolver {
public:
    VolumeResolver(IContainerRuntime& runtime, const RunContext& context);

    // Throws VolumeResolutionError; touches nothing
    std::vector<MountSpec> resolve(const ContainerConfig& container) const;
    MountSpec resolve(const VolumeMount& volume, const std::string& container_name) const;

    // Creates the named volumes of cache mounts that do not exist yet
    void ensure_caches(const std::vector<MountSpec>& mounts);

private:
    IContainerRuntime& runtime_;
    const RunContext& context_;
};
