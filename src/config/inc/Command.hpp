#pragma once

#include <string>
#include <vector>

// A command as written in the config file plus its argv form
struct Command {
    std::string original;
    std::vector<std::string> args;

    Command() = default;
    explicit Command(const std::string& text);

    // Appends extra arguments given on the command line
    Command with_extra_args(const std::vector<std::string>& extra) const;

    bool operator==(const Command& other) const { return args == other.args; }
    bool operator!=(const Command& other) const { return !(*this == other); }
};
