#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Graph or plan construction failed; nothing has been created yet
class ConfigGraphError : public std::runtime_error {
public:
    explicit ConfigGraphError(const std::string& message) : std::runtime_error(message) {}
};

class CyclicDependencyError : public ConfigGraphError {
public:
    explicit CyclicDependencyError(std::vector<std::string> cycle)
        : ConfigGraphError("Dependency cycle detected: " + describe(cycle)),
          cycle_(std::move(cycle)) {}

    // Names along the cycle, first name repeated at the end
    const std::vector<std::string>& cycle() const { return cycle_; }

private:
    static std::string describe(const std::vector<std::string>& cycle) {
        std::string text;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) text += " -> ";
            text += cycle[i];
        }
        return text;
    }

    std::vector<std::string> cycle_;
};

class UnknownReferenceError : public ConfigGraphError {
public:
    UnknownReferenceError(const std::string& kind, const std::string& name, const std::string& referenced_by)
        : ConfigGraphError(referenced_by.empty()
              ? "Unknown " + kind + " '" + name + "'"
              : referenced_by + " references unknown " + kind + " '" + name + "'"),
          name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// A volume could not be mapped to something the runtime can mount
class VolumeResolutionError : public std::runtime_error {
public:
    explicit VolumeResolutionError(const std::string& message) : std::runtime_error(message) {}
};

// A container failed to be created, started or become ready
class ContainerLifecycleError : public std::runtime_error {
public:
    ContainerLifecycleError(const std::string& container, const std::string& message)
        : std::runtime_error("Container '" + container + "': " + message),
          container_(container) {}

    const std::string& container() const { return container_; }

private:
    std::string container_;
};

// Work abandoned because of a cancellation request or a sibling failure
class OperationCancelledError : public std::runtime_error {
public:
    explicit OperationCancelledError(const std::string& message) : std::runtime_error(message) {}
};

// One or more resources could not be removed during teardown
class CleanupError : public std::runtime_error {
public:
    explicit CleanupError(std::vector<std::string> failures)
        : std::runtime_error(describe(failures)),
          failures_(std::move(failures)) {}

    const std::vector<std::string>& failures() const { return failures_; }

private:
    static std::string describe(const std::vector<std::string>& failures) {
        std::string text = std::to_string(failures.size()) + " resource(s) could not be cleaned up";
        for (const auto& failure : failures) {
            text += "\n  - " + failure;
        }
        return text;
    }

    std::vector<std::string> failures_;
};
