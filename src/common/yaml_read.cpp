// ---------------------------------------------------------------------------
// yaml_read.cpp
// ---------------------------------------------------------------------------

#include "common/yaml_read.hpp"

std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

double read_double(const YAML::Node& node, double fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

std::optional<double> read_optional_double(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

std::optional<std::size_t> read_optional_size(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<std::size_t>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}
