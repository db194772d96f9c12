#include "ConfigData.hpp"
#include <algorithm>

const ContainerConfig* ConfigData::find_container(const std::string& name) const {
    auto it = std::find_if(containers.begin(), containers.end(),
        [&name](const ContainerConfig& c) { return c.name == name; });
    return it == containers.end() ? nullptr : &*it;
}

const TaskConfig* ConfigData::find_task(const std::string& name) const {
    auto it = std::find_if(tasks.begin(), tasks.end(),
        [&name](const TaskConfig& t) { return t.name == name; });
    return it == tasks.end() ? nullptr : &*it;
}
