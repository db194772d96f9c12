#include "Command.hpp"
#include "ConfigError.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

Command::Command(const std::string& text) : original(text) {
    try {
        args = StringUtils::split_command(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    if (args.empty()) {
        throw ConfigError("Command must not be empty");
    }
}

Command Command::with_extra_args(const std::vector<std::string>& extra) const {
    Command result = *this;
    for (const auto& arg : extra) {
        result.args.push_back(arg);
        result.original += " " + arg;
    }
    return result;
}
