#include "DockerCliRuntime.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <system_error>

DockerCliRuntime::DockerCliRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    if (docker_binary_.empty()) {
        throw std::invalid_argument("Docker binary must not be empty");
    }
}

ProcessUtils::ProcessResult DockerCliRuntime::run_docker(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    LogUtils::debug("Executing: {}", ProcessUtils::describe(argv));
    try {
        return ProcessUtils::run(argv);
    } catch (const std::system_error& e) {
        throw ContainerRuntimeError("Could not launch " + docker_binary_, e.what());
    }
}

std::string DockerCliRuntime::run_checked(const std::vector<std::string>& args, const std::string& action) const {
    auto result = run_docker(args);
    if (!result.succeeded()) {
        std::string detail = StringUtils::trimmed(result.stderr_text);
        if (detail.empty()) {
            detail = "exit code " + std::to_string(result.exit_code);
        }
        throw ContainerRuntimeError(action + " failed", detail);
    }
    return StringUtils::trimmed(result.stdout_text);
}

bool DockerCliRuntime::is_not_found(const ProcessUtils::ProcessResult& result) {
    const std::string err = StringUtils::to_lower(result.stderr_text);
    return err.find("no such") != std::string::npos || err.find("not found") != std::string::npos;
}

std::string DockerCliRuntime::create_network(const std::string& name,
                                             const std::map<std::string, std::string>& labels) {
    std::vector<std::string> args = {"network", "create", "--driver", "bridge"};
    for (const auto& [key, value] : labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(name);
    return run_checked(args, "Creating network '" + name + "'");
}

void DockerCliRuntime::remove_network(const std::string& network_id) {
    auto result = run_docker({"network", "rm", network_id});
    if (result.succeeded()) return;

    if (is_not_found(result)) {
        LogUtils::debug("Network {} was already removed", network_id);
        return;
    }
    throw ContainerRuntimeError("Removing network '" + network_id + "' failed",
                                StringUtils::trimmed(result.stderr_text));
}

void DockerCliRuntime::pull_image_if_absent(const std::string& image) {
    {
        std::lock_guard<std::mutex> lock(images_mutex_);
        if (available_images_.count(image)) return;
    }

    auto inspect = run_docker({"image", "inspect", "--format", "{{.Id}}", image});
    if (!inspect.succeeded()) {
        LogUtils::info("Pulling image {}", image);
        run_checked({"pull", image}, "Pulling image '" + image + "'");
    }

    std::lock_guard<std::mutex> lock(images_mutex_);
    available_images_.insert(image);
}

std::string DockerCliRuntime::build_image(const ImageBuildRequest& request) {
    std::vector<std::string> args = {"build", "--tag", request.tag};
    if (request.dockerfile) {
        args.push_back("--file");
        args.push_back(*request.dockerfile);
    }
    args.push_back(request.context_directory);

    LogUtils::info("Building image {} from {}", request.tag, request.context_directory);
    const std::string output = run_checked(args, "Building image from '" + request.context_directory + "'");
    if (!output.empty()) {
        LogUtils::debug("Build output:\n{}", output);
    }

    std::lock_guard<std::mutex> lock(images_mutex_);
    available_images_.insert(request.tag);
    return request.tag;
}

void DockerCliRuntime::ensure_volume(const std::string& name) {
    auto inspect = run_docker({"volume", "inspect", name});
    if (inspect.succeeded()) return;

    LogUtils::debug("Creating volume {}", name);
    run_checked({"volume", "create", "--label", "taskbox.cache=true", name},
                "Creating volume '" + name + "'");
}

std::vector<std::string> DockerCliRuntime::build_create_args(const ContainerCreateRequest& request) {
    std::vector<std::string> args = {"create", "--name", request.name};

    if (!request.network.empty()) {
        args.push_back("--network");
        args.push_back(request.network);
        if (!request.network_alias.empty()) {
            args.push_back("--network-alias");
            args.push_back(request.network_alias);
            args.push_back("--hostname");
            args.push_back(request.network_alias);
        }
    }

    for (const auto& [key, value] : request.environment) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }

    for (const auto& mount : request.mounts) {
        args.push_back("--volume");
        args.push_back(mount.to_docker_arg());
    }

    for (const auto& port : request.ports) {
        args.push_back("--publish");
        args.push_back(port.to_docker_arg());
    }

    if (request.working_directory) {
        args.push_back("--workdir");
        args.push_back(*request.working_directory);
    }

    if (request.entrypoint) {
        args.push_back("--entrypoint");
        args.push_back(*request.entrypoint);
    }

    const auto& health = request.health_check;
    if (health.command) {
        args.push_back("--health-cmd");
        args.push_back(health.command->original);
    }
    if (health.interval) {
        args.push_back("--health-interval");
        args.push_back(HealthCheckConfig::format_duration(*health.interval));
    }
    if (health.timeout) {
        args.push_back("--health-timeout");
        args.push_back(HealthCheckConfig::format_duration(*health.timeout));
    }
    if (health.start_period) {
        args.push_back("--health-start-period");
        args.push_back(HealthCheckConfig::format_duration(*health.start_period));
    }
    if (health.retries) {
        args.push_back("--health-retries");
        args.push_back(std::to_string(*health.retries));
    }

    for (const auto& [key, value] : request.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    args.push_back(request.image);
    args.insert(args.end(), request.command.begin(), request.command.end());
    return args;
}

std::string DockerCliRuntime::create_container(const ContainerCreateRequest& request) {
    return run_checked(build_create_args(request), "Creating container '" + request.name + "'");
}

void DockerCliRuntime::start_container(const std::string& container_id) {
    run_checked({"start", container_id}, "Starting container '" + container_id + "'");
}

ContainerHealth DockerCliRuntime::parse_state(const std::string& state_json) {
    nlohmann::json state;
    try {
        state = nlohmann::json::parse(state_json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ContainerRuntimeError("Unexpected container state output", e.what());
    }

    ContainerHealth result;
    const std::string status = state.value("Status", "");
    if (status == "created") {
        result.status = ContainerStatus::Created;
    } else if (status == "running" || status == "restarting") {
        result.status = ContainerStatus::Running;
    } else if (status == "exited" || status == "dead") {
        result.status = ContainerStatus::Exited;
    }
    result.exit_code = state.value("ExitCode", 0);

    auto health = state.find("Health");
    if (health != state.end() && health->is_object()) {
        const std::string health_status = health->value("Status", "");
        if (health_status == "starting") {
            result.health = HealthStatus::Starting;
        } else if (health_status == "healthy") {
            result.health = HealthStatus::Healthy;
        } else if (health_status == "unhealthy") {
            result.health = HealthStatus::Unhealthy;
        }

        auto log = health->find("Log");
        if (log != health->end() && log->is_array() && !log->empty()) {
            result.last_health_output = StringUtils::trimmed(log->back().value("Output", ""));
        }
    }
    return result;
}

ContainerHealth DockerCliRuntime::inspect_container_health(const std::string& container_id) {
    return parse_state(run_checked({"inspect", "--format", "{{json .State}}", container_id},
                                   "Inspecting container '" + container_id + "'"));
}

void DockerCliRuntime::stream_container_output(const std::string& container_id,
                                               const OutputCallback& on_stdout,
                                               const OutputCallback& on_stderr) {
    std::vector<std::string> argv = {docker_binary_, "logs", "--follow", container_id};
    LogUtils::debug("Executing: {}", ProcessUtils::describe(argv));

    int exit_code = 0;
    try {
        exit_code = ProcessUtils::run_streaming(argv, on_stdout, on_stderr);
    } catch (const std::system_error& e) {
        throw ContainerRuntimeError("Could not launch " + docker_binary_, e.what());
    }
    if (exit_code != 0) {
        throw ContainerRuntimeError("Streaming output of container '" + container_id + "' failed",
                                    "exit code " + std::to_string(exit_code));
    }
}

int DockerCliRuntime::wait_container_exit(const std::string& container_id) {
    const std::string output = run_checked({"wait", container_id},
                                           "Waiting for container '" + container_id + "'");
    // Only the last line carries the exit code
    const auto lines = StringUtils::split(output, '\n');
    const std::string code = StringUtils::trimmed(lines.empty() ? output : lines.back());
    try {
        size_t pos = 0;
        const int exit_code = std::stoi(code, &pos);
        if (pos != code.size()) {
            throw std::invalid_argument(code);
        }
        return exit_code;
    } catch (const std::logic_error&) {
        throw ContainerRuntimeError("Unexpected output from docker wait", output);
    }
}

void DockerCliRuntime::stop_container(const std::string& container_id, std::chrono::seconds timeout) {
    auto result = run_docker({"stop", "--time", std::to_string(timeout.count()), container_id});
    if (result.succeeded() || is_not_found(result)) return;

    throw ContainerRuntimeError("Stopping container '" + container_id + "' failed",
                                StringUtils::trimmed(result.stderr_text));
}

void DockerCliRuntime::remove_container(const std::string& container_id) {
    auto result = run_docker({"rm", "--force", "--volumes", container_id});
    if (result.succeeded()) return;

    if (is_not_found(result)) {
        LogUtils::debug("Container {} was already removed", container_id);
        return;
    }
    throw ContainerRuntimeError("Removing container '" + container_id + "' failed",
                                StringUtils::trimmed(result.stderr_text));
}
