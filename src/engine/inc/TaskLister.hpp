#pragma once

#include <ostream>
#include "ConfigData.hpp"

// Prints the available tasks grouped by their group, each group and the tasks
// inside it sorted by name. Tasks without a group come last.
class TaskLister {
public:
    static void print(const ConfigData& config, std::ostream& out);
};
