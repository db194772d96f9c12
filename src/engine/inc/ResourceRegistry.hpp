#pragma once

#include <mutex>
#include <string>
#include <vector>

struct ContainerHandle {
    std::string id;                 // runtime id
    std::string name;               // container definition name
    std::string runtime_name;       // unique name given to the runtime

    bool operator==(const ContainerHandle& other) const { return id == other.id; }
};

// Containers created by one task execution and still pending removal.
// Safe for concurrent startup workers and the cancellation path.
class ResourceRegistry {
public:
    ResourceRegistry() = default;
    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    void register_container(const ContainerHandle& handle);

    // Returns false when the id was not registered
    bool release_container(const std::string& id);

    // Creation order
    std::vector<ContainerHandle> containers() const;
    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<ContainerHandle> containers_;
};
