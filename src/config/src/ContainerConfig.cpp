#include "ContainerConfig.hpp"
#include "ConfigError.hpp"
#include "StringUtils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

std::chrono::milliseconds HealthCheckConfig::parse_duration(const std::string& text) {
    const std::string input = StringUtils::trimmed(text);
    if (input.empty()) {
        throw ConfigError("Duration must not be empty");
    }

    std::chrono::milliseconds total{0};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t digits_end = pos;
        while (digits_end < input.size() && std::isdigit(static_cast<unsigned char>(input[digits_end]))) {
            ++digits_end;
        }
        if (digits_end == pos) {
            throw ConfigError("Invalid duration '" + input + "': expected a number at position " + std::to_string(pos));
        }

        long long value = 0;
        try {
            value = std::stoll(input.substr(pos, digits_end - pos));
        } catch (const std::out_of_range&) {
            throw ConfigError("Invalid duration '" + input + "': value out of range");
        }

        size_t unit_end = digits_end;
        while (unit_end < input.size() && std::isalpha(static_cast<unsigned char>(input[unit_end]))) {
            ++unit_end;
        }
        const std::string unit = input.substr(digits_end, unit_end - digits_end);

        long long unit_ms = 0;
        if (unit == "ms") {
            unit_ms = 1;
        } else if (unit == "s") {
            unit_ms = 1000;
        } else if (unit == "m") {
            unit_ms = 60 * 1000;
        } else if (unit == "h") {
            unit_ms = 60 * 60 * 1000;
        } else {
            throw ConfigError("Invalid duration '" + input + "': unknown unit '" + unit + "'");
        }

        const long long limit = std::numeric_limits<std::chrono::milliseconds::rep>::max();
        if (value > (limit - total.count()) / unit_ms) {
            throw ConfigError("Invalid duration '" + input + "': value out of range");
        }
        total += std::chrono::milliseconds(value * unit_ms);
        pos = unit_end;
    }
    return total;
}

std::string HealthCheckConfig::format_duration(std::chrono::milliseconds duration) {
    return std::to_string(duration.count()) + "ms";
}

VolumeMount VolumeMount::parse(const std::string& text) {
    const auto parts = StringUtils::split(text, ':');
    if (parts.size() < 2 || parts.size() > 3) {
        throw ConfigError("Invalid volume mount '" + text + "': expected <local>:<container>[:<options>]");
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            throw ConfigError("Invalid volume mount '" + text + "': empty component");
        }
    }

    VolumeMount mount;
    mount.type = Type::Local;
    mount.local_path = parts[0];
    mount.container_path = parts[1];
    if (parts.size() == 3) {
        mount.options = parts[2];
    }
    return mount;
}

std::string VolumeMount::describe() const {
    std::string text = (type == Type::Cache ? "cache " + cache_name : local_path) + " -> " + container_path;
    if (options) {
        text += " (" + *options + ")";
    }
    return text;
}

void PortMapping::validate_port(int port, const std::string& context) {
    if (port < 1 || port > 65535) {
        throw ConfigError("Invalid port " + std::to_string(port) + " in " + context + ": must be between 1 and 65535");
    }
}

PortMapping PortMapping::parse(const std::string& text) {
    std::string spec = text;
    PortMapping mapping;

    const auto slash = spec.find('/');
    if (slash != std::string::npos) {
        mapping.protocol = StringUtils::to_lower(spec.substr(slash + 1));
        spec = spec.substr(0, slash);
    }
    if (mapping.protocol != "tcp" && mapping.protocol != "udp" && mapping.protocol != "sctp") {
        throw ConfigError("Invalid port mapping '" + text + "': unknown protocol '" + mapping.protocol + "'");
    }

    const auto parts = StringUtils::split(spec, ':');
    if (parts.size() != 2) {
        throw ConfigError("Invalid port mapping '" + text + "': expected <local>:<container>[/<protocol>]");
    }

    try {
        size_t consumed = 0;
        mapping.local_port = std::stoi(parts[0], &consumed);
        if (consumed != parts[0].size()) throw std::invalid_argument(parts[0]);
        mapping.container_port = std::stoi(parts[1], &consumed);
        if (consumed != parts[1].size()) throw std::invalid_argument(parts[1]);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid port mapping '" + text + "': ports must be numbers");
    }

    validate_port(mapping.local_port, "port mapping '" + text + "'");
    validate_port(mapping.container_port, "port mapping '" + text + "'");
    return mapping;
}

std::string PortMapping::to_docker_arg() const {
    return std::to_string(local_port) + ":" + std::to_string(container_port) + "/" + protocol;
}
