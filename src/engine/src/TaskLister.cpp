#include "TaskLister.hpp"
#include <algorithm>
#include <map>
#include <vector>

namespace {

void print_group(const std::string& title, std::vector<const TaskConfig*> tasks, std::ostream& out) {
    std::sort(tasks.begin(), tasks.end(),
              [](const TaskConfig* a, const TaskConfig* b) { return a->name < b->name; });

    out << title << ":\n";
    for (const auto* task : tasks) {
        out << "- " << task->name;
        if (!task->description.empty()) {
            out << ": " << task->description;
        }
        out << "\n";
    }
}

}

void TaskLister::print(const ConfigData& config, std::ostream& out) {
    if (config.tasks.empty()) {
        out << "No tasks defined.\n";
        return;
    }

    std::map<std::string, std::vector<const TaskConfig*>> groups;
    std::vector<const TaskConfig*> ungrouped;
    for (const auto& task : config.tasks) {
        if (task.group.empty()) {
            ungrouped.push_back(&task);
        } else {
            groups[task.group].push_back(&task);
        }
    }

    if (groups.empty()) {
        print_group("Available tasks", ungrouped, out);
        return;
    }

    bool first = true;
    for (const auto& [group, tasks] : groups) {
        if (!first) out << "\n";
        print_group(group, tasks, out);
        first = false;
    }
    if (!ungrouped.empty()) {
        out << "\n";
        print_group("Ungrouped tasks", ungrouped, out);
    }
}
