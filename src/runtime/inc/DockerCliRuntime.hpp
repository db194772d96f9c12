#pragma once

#include "IContainerRuntime.hpp"
#include "ProcessUtils.hpp"
#include <mutex>
#include <set>
#include <string>
#include <vector>

// IContainerRuntime backed by the docker command line client
class DockerCliRuntime : public IContainerRuntime {
public:
    explicit DockerCliRuntime(std::string docker_binary = "docker");

    std::string create_network(const std::string& name,
                               const std::map<std::string, std::string>& labels) override;
    void remove_network(const std::string& network_id) override;

    void pull_image_if_absent(const std::string& image) override;
    std::string build_image(const ImageBuildRequest& request) override;
    void ensure_volume(const std::string& name) override;

    std::string create_container(const ContainerCreateRequest& request) override;
    void start_container(const std::string& container_id) override;
    ContainerHealth inspect_container_health(const std::string& container_id) override;

    void stream_container_output(const std::string& container_id,
                                 const OutputCallback& on_stdout,
                                 const OutputCallback& on_stderr) override;
    int wait_container_exit(const std::string& container_id) override;

    void stop_container(const std::string& container_id, std::chrono::seconds timeout) override;
    void remove_container(const std::string& container_id) override;

    // Arguments after the binary for `docker create`
    static std::vector<std::string> build_create_args(const ContainerCreateRequest& request);

    // Parses the output of `docker inspect --format '{{json .State}}'`
    static ContainerHealth parse_state(const std::string& state_json);

private:
    ProcessUtils::ProcessResult run_docker(const std::vector<std::string>& args) const;
    // Runs docker and returns trimmed stdout, throwing ContainerRuntimeError on failure
    std::string run_checked(const std::vector<std::string>& args, const std::string& action) const;

    static bool is_not_found(const ProcessUtils::ProcessResult& result);

    std::string docker_binary_;

    std::mutex images_mutex_;
    std::set<std::string> available_images_;
};
