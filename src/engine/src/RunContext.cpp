#include "RunContext.hpp"
#include "StringUtils.hpp"
#include <random>

RunContext::RunContext(std::string project, std::string run_id, std::filesystem::path config_dir)
    : project(std::move(project)), run_id(std::move(run_id)), config_dir(std::move(config_dir)) {}

std::string RunContext::generate_run_id() {
    static const char digits[] = "0123456789abcdef";
    std::random_device device;
    std::mt19937 engine(device());
    std::uniform_int_distribution<int> pick(0, 15);

    std::string id;
    for (int i = 0; i < 8; ++i) {
        id += digits[pick(engine)];
    }
    return id;
}

std::string RunContext::network_name() const {
    return "taskbox-" + StringUtils::sanitize_name(project) + "-" + run_id;
}

std::string RunContext::container_name(const std::string& container) const {
    return StringUtils::sanitize_name(project) + "-" + StringUtils::sanitize_name(container) + "-" + run_id;
}

std::string RunContext::image_tag(const std::string& container) const {
    return "taskbox-" + StringUtils::sanitize_name(project) + "-" + StringUtils::sanitize_name(container);
}

std::string RunContext::cache_volume_name(const std::string& cache) const {
    return "taskbox-cache-" + StringUtils::sanitize_name(project) + "-" + cache;
}

std::map<std::string, std::string> RunContext::labels() const {
    return {
        {"taskbox.project", project},
        {"taskbox.run-id", run_id}
    };
}
