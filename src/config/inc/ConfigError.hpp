#pragma once

#include <stdexcept>
#include <string>

// Invalid or inconsistent configuration detected while loading
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};
