#include "ContainerRuntimeTypes.hpp"

const char* to_string(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::Created: return "created";
        case ContainerStatus::Running: return "running";
        case ContainerStatus::Exited:  return "exited";
        case ContainerStatus::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(HealthStatus health) {
    switch (health) {
        case HealthStatus::None:      return "none";
        case HealthStatus::Starting:  return "starting";
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "none";
}
