// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace boxtrack {

/**
 * Typed tracker parameters, keyed by name
 *
 * Each getter returns default_value when the key is absent. get_float also
 * accepts a value stored as an integer.
 */
struct TrackerConfig {
    std::unordered_map<std::string, float> float_params;
    std::unordered_map<std::string, int> int_params;
    std::unordered_map<std::string, bool> bool_params;
    std::unordered_map<std::string, std::string> string_params;

    float get_float(const std::string& key, float default_value) const;
    int get_int(const std::string& key, int default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;
    std::string get_string(const std::string& key, const std::string& default_value) const;

    /**
     * Copy every entry of other into this config, replacing existing keys
     */
    void merge(const TrackerConfig& other);
};

/**
 * Parse tracker configuration from a YAML node
 *
 * Each top-level key maps either to a scalar (max_age: 1) or to a tuning entry
 * whose "default" field holds the value (iou_threshold: {type: uniform, default: 0.3}).
 */
TrackerConfig parse_tracker_config(const YAML::Node& yaml_config);

/**
 * Read a tracker YAML file
 * @throws std::runtime_error if the file does not exist
 * @throws YAML::Exception if the file is not valid YAML
 */
TrackerConfig load_tracker_config(const std::string& config_path);

// configs/trackers/<tracker_type>.yaml
std::string get_tracker_config_path(const std::string& tracker_type);

} // namespace boxtrack
