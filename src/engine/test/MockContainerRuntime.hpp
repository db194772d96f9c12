#pragma once

#include "IContainerRuntime.hpp"
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// In-memory runtime for engine tests. Behaviour is keyed by container
// definition name (the network alias) and configured before use; every call is
// recorded as "<operation>:<subject>".
class MockContainerRuntime : public IContainerRuntime {
public:
    // Behaviour
    std::map<std::string, int> exit_codes;
    std::map<std::string, std::string> output;
    std::set<std::string> fail_pull;            // images
    std::set<std::string> fail_create;
    std::set<std::string> fail_start;
    std::set<std::string> fail_remove;
    std::set<std::string> exit_before_ready;
    std::set<std::string> unhealthy;
    std::set<std::string> never_ready;
    std::set<std::string> health_checked;       // starting on first inspection, healthy afterwards
    std::set<std::string> blocking;             // wait_container_exit blocks until stopped
    bool fail_network_create = false;
    bool fail_network_remove = false;
    std::function<void(const std::string&)> on_pull;   // runs while the image is being fetched
    std::function<void(const std::string&)> on_exit;   // runs as a container exits

    std::string create_network(const std::string& name, const std::map<std::string, std::string>&) override {
        record("network_create:" + name);
        if (fail_network_create) {
            throw ContainerRuntimeError("Creating network '" + name + "' failed", "daemon unavailable");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++networks_created_;
        return "net-" + std::to_string(networks_created_);
    }

    void remove_network(const std::string& network_id) override {
        record("network_remove:" + network_id);
        if (fail_network_remove) {
            throw ContainerRuntimeError("Removing network failed", "network has active endpoints");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++networks_removed_;
    }

    void pull_image_if_absent(const std::string& image) override {
        record("pull:" + image);
        if (on_pull) {
            on_pull(image);
        }
        if (fail_pull.count(image)) {
            throw ContainerRuntimeError("Pulling image '" + image + "' failed", "manifest unknown");
        }
    }

    std::string build_image(const ImageBuildRequest& request) override {
        record("build:" + request.tag);
        std::lock_guard<std::mutex> lock(mutex_);
        builds_.push_back(request);
        return request.tag;
    }

    void ensure_volume(const std::string& name) override {
        record("volume:" + name);
    }

    std::string create_container(const ContainerCreateRequest& request) override {
        record("create:" + request.network_alias);
        if (fail_create.count(request.network_alias)) {
            throw ContainerRuntimeError("Creating container failed", "port is already allocated");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string id = "id-" + std::to_string(requests_.size() + 1);
        requests_.push_back(request);
        aliases_[id] = request.network_alias;
        return id;
    }

    void start_container(const std::string& container_id) override {
        const std::string name = alias(container_id);
        record("start:" + name);
        if (fail_start.count(name)) {
            throw ContainerRuntimeError("Starting container failed", "driver failed programming external connectivity");
        }
    }

    ContainerHealth inspect_container_health(const std::string& container_id) override {
        const std::string name = alias(container_id);
        record("inspect:" + name);

        ContainerHealth health;
        health.status = ContainerStatus::Running;
        if (exit_before_ready.count(name)) {
            health.status = ContainerStatus::Exited;
            health.exit_code = 1;
        } else if (unhealthy.count(name)) {
            health.health = HealthStatus::Unhealthy;
            health.last_health_output = "connection refused";
        } else if (never_ready.count(name)) {
            health.health = HealthStatus::Starting;
        } else if (health_checked.count(name)) {
            std::lock_guard<std::mutex> lock(mutex_);
            health.health = inspections_[container_id]++ == 0 ? HealthStatus::Starting : HealthStatus::Healthy;
        }
        return health;
    }

    void stream_container_output(const std::string& container_id,
                                 const OutputCallback& on_stdout,
                                 const OutputCallback&) override {
        const std::string name = alias(container_id);
        auto it = output.find(name);
        if (it != output.end() && on_stdout) {
            on_stdout(it->second);
        }
    }

    int wait_container_exit(const std::string& container_id) override {
        const std::string name = alias(container_id);
        record("wait:" + name);
        if (blocking.count(name)) {
            std::unique_lock<std::mutex> lock(mutex_);
            stopped_cv_.wait(lock, [&] { return stopped_.count(container_id) > 0; });
            return 137;
        }
        if (on_exit) {
            on_exit(name);
        }
        auto it = exit_codes.find(name);
        return it == exit_codes.end() ? 0 : it->second;
    }

    void stop_container(const std::string& container_id, std::chrono::seconds) override {
        record("stop:" + alias(container_id));
        mark_stopped(container_id);
    }

    void remove_container(const std::string& container_id) override {
        const std::string name = alias(container_id);
        record("remove:" + name);
        if (fail_remove.count(name)) {
            throw ContainerRuntimeError("Removing container failed", "device or resource busy");
        }
        mark_stopped(container_id);
    }

    // Inspection
    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Subjects of the recorded calls of one operation, in call order
    std::vector<std::string> subjects(const std::string& operation) const {
        std::vector<std::string> result;
        const std::string prefix = operation + ":";
        for (const auto& call : calls()) {
            if (call.compare(0, prefix.size(), prefix) == 0) {
                result.push_back(call.substr(prefix.size()));
            }
        }
        return result;
    }

    size_t count(const std::string& operation) const { return subjects(operation).size(); }

    bool called(const std::string& call) const {
        const auto all = calls();
        return std::find(all.begin(), all.end(), call) != all.end();
    }

    // Position of the first matching call, or npos
    size_t index_of(const std::string& call) const {
        const auto all = calls();
        auto it = std::find(all.begin(), all.end(), call);
        return it == all.end() ? std::string::npos : static_cast<size_t>(it - all.begin());
    }

    std::vector<ContainerCreateRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    const ContainerCreateRequest* request_for(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& request : requests_) {
            if (request.network_alias == name) return &request;
        }
        return nullptr;
    }

    std::vector<ImageBuildRequest> builds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return builds_;
    }

    int networks_created() const { std::lock_guard<std::mutex> lock(mutex_); return networks_created_; }
    int networks_removed() const { std::lock_guard<std::mutex> lock(mutex_); return networks_removed_; }

private:
    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    std::string alias(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = aliases_.find(container_id);
        return it == aliases_.end() ? container_id : it->second;
    }

    void mark_stopped(const std::string& container_id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.insert(container_id);
        }
        stopped_cv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable stopped_cv_;
    std::vector<std::string> calls_;
    std::vector<ContainerCreateRequest> requests_;
    std::vector<ImageBuildRequest> builds_;
    std::map<std::string, std::string> aliases_;
    std::map<std::string, int> inspections_;
    std::set<std::string> stopped_;
    int networks_created_ = 0;
    int networks_removed_ = 0;
};
