#include "ContainerLifecycleManager.hpp"
#include "LogUtils.hpp"
#include "OrchestrationErrors.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds STOP_CHECK_INTERVAL{20};

}

ContainerLifecycleManager::ContainerLifecycleManager(IContainerRuntime& runtime,
                                                     ResourceRegistry& registry,
                                                     const RunContext& context)
    : runtime_(runtime), registry_(registry), context_(context), volumes_(runtime, context) {}

std::string ContainerLifecycleManager::prepare_image(const ContainerConfig& container) {
    if (container.image) {
        runtime_.pull_image_if_absent(*container.image);
        return *container.image;
    }

    if (!container.build_directory) {
        throw ContainerLifecycleError(container.name, "neither an image nor a build directory is configured");
    }

    fs::path directory(*container.build_directory);
    if (directory.is_relative()) {
        directory = context_.config_dir / directory;
    }
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw ContainerLifecycleError(container.name, "build directory '" + directory.string() + "' does not exist");
    }

    ImageBuildRequest request;
    request.context_directory = directory.string();
    if (container.dockerfile) {
        request.dockerfile = (directory / *container.dockerfile).string();
    }
    request.tag = context_.image_tag(container.name);
    return runtime_.build_image(request);
}

ContainerHandle ContainerLifecycleManager::create(const ContainerConfig& container, const std::string& network_id) {
    const auto mounts = volumes_.resolve(container);

    ContainerHandle handle;
    handle.name = container.name;
    handle.runtime_name = context_.container_name(container.name);

    try {
        ContainerCreateRequest request;
        request.name = handle.runtime_name;
        request.image = prepare_image(container);
        request.network = network_id;
        request.network_alias = container.name;
        if (container.command) {
            request.command = container.command->args;
        }
        request.entrypoint = container.entrypoint;
        request.environment = container.environment;
        request.working_directory = container.working_directory;
        request.mounts = mounts;
        request.ports = container.ports;
        request.health_check = container.health_check;
        request.labels = context_.labels();
        request.labels["taskbox.container"] = container.name;

        volumes_.ensure_caches(mounts);
        handle.id = runtime_.create_container(request);
    } catch (const ContainerRuntimeError& e) {
        throw ContainerLifecycleError(container.name, e.what());
    }

    registry_.register_container(handle);
    LogUtils::debug("Created container {} ({})", handle.runtime_name, handle.id);
    return handle;
}

void ContainerLifecycleManager::start(const ContainerHandle& handle) {
    try {
        runtime_.start_container(handle.id);
    } catch (const ContainerRuntimeError& e) {
        throw ContainerLifecycleError(handle.name, e.what());
    }
    LogUtils::debug("Started container {}", handle.runtime_name);
}

void ContainerLifecycleManager::await_ready(const ContainerHandle& handle,
                                            const ReadinessPolicy& policy,
                                            const StopPredicate& should_stop) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + policy.timeout;

    while (true) {
        if (should_stop && should_stop()) {
            throw OperationCancelledError("Stopped waiting for container '" + handle.name + "'");
        }

        ContainerHealth health;
        try {
            health = runtime_.inspect_container_health(handle.id);
        } catch (const ContainerRuntimeError& e) {
            throw ContainerLifecycleError(handle.name, e.what());
        }

        if (health.status == ContainerStatus::Exited) {
            throw ContainerLifecycleError(handle.name,
                "exited with code " + std::to_string(health.exit_code) + " before becoming ready");
        }
        if (health.health == HealthStatus::Unhealthy) {
            std::string message = "did not pass its health check";
            if (!health.last_health_output.empty()) {
                message += ", last output: " + health.last_health_output;
            }
            throw ContainerLifecycleError(handle.name, message);
        }
        if (health.status == ContainerStatus::Running &&
            (health.health == HealthStatus::None || health.health == HealthStatus::Healthy)) {
            return;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            throw ContainerLifecycleError(handle.name, "did not become ready within " +
                HealthCheckConfig::format_duration(policy.timeout) + " (status " + to_string(health.status) +
                ", health " + to_string(health.health) + ")");
        }

        const auto wake = std::min(now + policy.poll_interval, deadline);
        while (Clock::now() < wake) {
            if (should_stop && should_stop()) break;
            std::this_thread::sleep_for(std::min<Clock::duration>(STOP_CHECK_INTERVAL, wake - Clock::now()));
        }
    }
}

void ContainerLifecycleManager::stop(const ContainerHandle& handle, std::chrono::seconds timeout) {
    try {
        runtime_.stop_container(handle.id, timeout);
    } catch (const ContainerRuntimeError& e) {
        throw ContainerLifecycleError(handle.name, e.what());
    }
}

void ContainerLifecycleManager::remove(const ContainerHandle& handle) {
    try {
        runtime_.remove_container(handle.id);
    } catch (const ContainerRuntimeError& e) {
        throw ContainerLifecycleError(handle.name, e.what());
    }
    registry_.release_container(handle.id);
    LogUtils::debug("Removed container {}", handle.runtime_name);
}

void ContainerLifecycleManager::remove_all(std::chrono::seconds stop_timeout) {
    auto handles = registry_.containers();
    std::vector<std::string> failures;

    for (auto it = handles.rbegin(); it != handles.rend(); ++it) {
        try {
            stop(*it, stop_timeout);
        } catch (const ContainerLifecycleError& e) {
            // Removal below is forced, so a failed stop alone does not leak anything
            LogUtils::warn("Could not stop {}: {}", it->runtime_name, e.what());
        }

        try {
            remove(*it);
        } catch (const ContainerLifecycleError& e) {
            LogUtils::error("Could not remove {}: {}", it->runtime_name, e.what());
            failures.push_back("container " + it->runtime_name + ": " + e.what());
        }
    }

    if (!failures.empty()) {
        throw CleanupError(std::move(failures));
    }
}
