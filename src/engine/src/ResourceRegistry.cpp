#include "ResourceRegistry.hpp"
#include <algorithm>

void ResourceRegistry::register_container(const ContainerHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    containers_.push_back(handle);
}

bool ResourceRegistry::release_container(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(containers_.begin(), containers_.end(),
                           [&id](const ContainerHandle& handle) { return handle.id == id; });
    if (it == containers_.end()) {
        return false;
    }
    containers_.erase(it);
    return true;
}

std::vector<ContainerHandle> ResourceRegistry::containers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_;
}

size_t ResourceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_.size();
}

bool ResourceRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_.empty();
}
