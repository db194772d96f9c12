#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

std::string StringUtils::trimmed(std::string str) {
    trim(str);
    return str;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(str);
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    if (!str.empty() && str.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::vector<std::string> StringUtils::split_command(const std::string& command) {
    enum class State { Normal, SingleQuote, DoubleQuote };

    std::vector<std::string> args;
    std::string current;
    bool in_argument = false;
    State state = State::Normal;

    for (size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];

        switch (state) {
            case State::Normal:
                if (std::isspace(static_cast<unsigned char>(c))) {
                    if (in_argument) {
                        args.push_back(current);
                        current.clear();
                        in_argument = false;
                    }
                } else if (c == '\'') {
                    state = State::SingleQuote;
                    in_argument = true;
                } else if (c == '"') {
                    state = State::DoubleQuote;
                    in_argument = true;
                } else if (c == '\\') {
                    if (i + 1 >= command.size()) {
                        throw std::invalid_argument("Command ends with a dangling backslash: " + command);
                    }
                    current += command[++i];
                    in_argument = true;
                } else {
                    current += c;
                    in_argument = true;
                }
                break;

            case State::SingleQuote:
                if (c == '\'') {
                    state = State::Normal;
                } else {
                    current += c;
                }
                break;

            case State::DoubleQuote:
                if (c == '"') {
                    state = State::Normal;
                } else if (c == '\\' && i + 1 < command.size() &&
                           (command[i + 1] == '"' || command[i + 1] == '\\' || command[i + 1] == '$' || command[i + 1] == '`')) {
                    current += command[++i];
                } else {
                    current += c;
                }
                break;
        }
    }

    if (state == State::SingleQuote) {
        throw std::invalid_argument("Command has an unbalanced single quote: " + command);
    }
    if (state == State::DoubleQuote) {
        throw std::invalid_argument("Command has an unbalanced double quote: " + command);
    }
    if (in_argument) {
        args.push_back(current);
    }
    return args;
}

std::string StringUtils::sanitize_name(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == '-') {
            result += static_cast<char>(std::tolower(c));
        } else {
            result += '-';
        }
    }
    while (!result.empty() && !std::isalnum(static_cast<unsigned char>(result.front()))) {
        result.erase(result.begin());
    }
    return result;
}

bool StringUtils::is_valid_docker_name(const std::string& str) {
    if (str.empty() || !std::isalnum(static_cast<unsigned char>(str.front()))) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}
