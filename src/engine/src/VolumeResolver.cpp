#include "VolumeResolver.hpp"
#include "LogUtils.hpp"
#include "OrchestrationErrors.hpp"
#include "StringUtils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

VolumeResolver::VolumeResolver(IContainerRuntime& runtime, const RunContext& context)
    : runtime_(runtime), context_(context) {}

std::vector<MountSpec> VolumeResolver::resolve(const ContainerConfig& container) const {
    std::vector<MountSpec> mounts;
    mounts.reserve(container.volumes.size());
    for (const auto& volume : container.volumes) {
        mounts.push_back(resolve(volume, container.name));
    }
    return mounts;
}

MountSpec VolumeResolver::resolve(const VolumeMount& volume, const std::string& container_name) const {
    const std::string context = "Volume '" + volume.describe() + "' of container '" + container_name + "'";

    if (volume.container_path.empty() || volume.container_path.front() != '/') {
        throw VolumeResolutionError(context + ": container path must be absolute");
    }

    MountSpec mount;
    mount.target = volume.container_path;
    mount.options = volume.options;

    if (volume.type == VolumeMount::Type::Cache) {
        if (!StringUtils::is_valid_docker_name(volume.cache_name)) {
            throw VolumeResolutionError(context + ": '" + volume.cache_name + "' is not a valid cache name");
        }
        mount.kind = MountSpec::Kind::Volume;
        mount.source = context_.cache_volume_name(volume.cache_name);
        return mount;
    }

    if (volume.local_path.empty()) {
        throw VolumeResolutionError(context + ": local path is empty");
    }

    fs::path local(volume.local_path);
    if (local.is_relative()) {
        local = context_.config_dir / local;
    }

    std::error_code ec;
    if (!fs::exists(local, ec)) {
        throw VolumeResolutionError(context + ": local path '" + local.string() + "' does not exist");
    }
    const fs::path canonical = fs::canonical(local, ec);
    if (ec) {
        throw VolumeResolutionError(context + ": cannot resolve '" + local.string() + "': " + ec.message());
    }

    mount.kind = MountSpec::Kind::Bind;
    mount.source = canonical.string();
    return mount;
}

void VolumeResolver::ensure_caches(const std::vector<MountSpec>& mounts) {
    for (const auto& mount : mounts) {
        if (mount.kind != MountSpec::Kind::Volume) continue;
        LogUtils::debug("Ensuring cache volume {}", mount.source);
        runtime_.ensure_volume(mount.source);
    }
}
