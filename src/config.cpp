// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/config.hpp>
#include <filesystem>
#include <stdexcept>

namespace boxtrack {

namespace {

template <typename T>
T lookup(const std::unordered_map<std::string, T>& params, const std::string& key,
         const T& default_value) {
    auto it = params.find(key);
    return (it != params.end()) ? it->second : default_value;
}

template <typename T>
void merge_into(std::unordered_map<std::string, T>& dst,
                const std::unordered_map<std::string, T>& src) {
    for (const auto& [key, value] : src) {
        dst[key] = value;
    }
}

bool is_integer_literal(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (start == text.size()) {
        return false;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    return true;
}

void store_scalar(TrackerConfig& config, const std::string& key, const YAML::Node& value) {
    const std::string text = value.as<std::string>();

    if (text == "true" || text == "True") {
        config.bool_params[key] = true;
        return;
    }
    if (text == "false" || text == "False") {
        config.bool_params[key] = false;
        return;
    }
    if (is_integer_literal(text)) {
        config.int_params[key] = value.as<int>();
        return;
    }

    float fval = 0.0f;
    if (YAML::convert<float>::decode(value, fval)) {
        config.float_params[key] = fval;
    } else {
        config.string_params[key] = text;
    }
}

} // namespace

float TrackerConfig::get_float(const std::string& key, float default_value) const {
    auto it = float_params.find(key);
    if (it != float_params.end()) {
        return it->second;
    }
    auto int_it = int_params.find(key);
    return (int_it != int_params.end()) ? static_cast<float>(int_it->second) : default_value;
}

int TrackerConfig::get_int(const std::string& key, int default_value) const {
    return lookup(int_params, key, default_value);
}

bool TrackerConfig::get_bool(const std::string& key, bool default_value) const {
    return lookup(bool_params, key, default_value);
}

std::string TrackerConfig::get_string(const std::string& key,
                                      const std::string& default_value) const {
    return lookup(string_params, key, default_value);
}

void TrackerConfig::merge(const TrackerConfig& other) {
    // A key keeps a single type: drop it from the other maps first
    for (const auto& entry : other.float_params) {
        int_params.erase(entry.first);
    }
    for (const auto& entry : other.int_params) {
        float_params.erase(entry.first);
    }
    merge_into(float_params, other.float_params);
    merge_into(int_params, other.int_params);
    merge_into(bool_params, other.bool_params);
    merge_into(string_params, other.string_params);
}

TrackerConfig parse_tracker_config(const YAML::Node& yaml_config) {
    TrackerConfig config;

    if (!yaml_config.IsMap()) {
        return config;
    }

    for (const auto& node : yaml_config) {
        std::string key = node.first.as<std::string>();
        const YAML::Node& value = node.second;

        if (value.IsMap()) {
            // Tuning entry: only the default is used
            if (value["default"] && value["default"].IsScalar()) {
                store_scalar(config, key, value["default"]);
            }
        } else if (value.IsScalar()) {
            store_scalar(config, key, value);
        }
    }

    return config;
}

TrackerConfig load_tracker_config(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path);
    }

    return parse_tracker_config(YAML::LoadFile(config_path));
}

std::string get_tracker_config_path(const std::string& tracker_type) {
    // Relative to the working directory
    return "configs/trackers/" + tracker_type + ".yaml";
}

} // namespace boxtrack
