#include "NetworkProvisioner.hpp"
#include "LogUtils.hpp"
#include "OrchestrationErrors.hpp"

NetworkProvisioner::NetworkProvisioner(IContainerRuntime& runtime, const RunContext& context)
    : runtime_(runtime), context_(context) {}

std::string NetworkProvisioner::ensure_network() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!network_id_) {
        const std::string name = context_.network_name();
        network_id_ = runtime_.create_network(name, context_.labels());
        LogUtils::debug("Created network {} ({})", name, *network_id_);
    }
    return *network_id_;
}

bool NetworkProvisioner::has_network() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return network_id_.has_value();
}

void NetworkProvisioner::remove_network() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!network_id_) return;

    const std::string id = *network_id_;
    network_id_.reset();
    try {
        runtime_.remove_network(id);
        LogUtils::debug("Removed network {}", context_.network_name());
    } catch (const ContainerRuntimeError& e) {
        throw CleanupError({"network " + context_.network_name() + ": " + e.what()});
    }
}
