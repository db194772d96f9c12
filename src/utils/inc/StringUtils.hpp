#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(std::string str);

    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Splits a command line into arguments. Supports single quotes, double quotes
    // and backslash escapes; performs no expansion. Throws std::invalid_argument
    // on unbalanced quotes or a trailing backslash.
    static std::vector<std::string> split_command(const std::string& command);

    // Lowercase and replace every character docker rejects in object names with '-'
    static std::string sanitize_name(const std::string& str);

    // Matches docker's volume/network name rule: [a-zA-Z0-9][a-zA-Z0-9_.-]*
    static bool is_valid_docker_name(const std::string& str);
};
