#pragma once

#include <filesystem>
#include <map>
#include <string>

// Identity of one top-level invocation; names every runtime object it creates
struct RunContext {
    std::string project;
    std::string run_id;
    std::filesystem::path config_dir;

    RunContext() = default;
    RunContext(std::string project, std::string run_id, std::filesystem::path config_dir);

    // Random lowercase hex identifier
    static std::string generate_run_id();

    std::string network_name() const;
    std::string container_name(const std::string& container) const;
    std::string image_tag(const std::string& container) const;
    std::string cache_volume_name(const std::string& cache) const;

    // Labels attached to every network and container of this run
    std::map<std::string, std::string> labels() const;
};
