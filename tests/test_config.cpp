// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 boxtrack contributors

#include <gtest/gtest.h>
#include <boxtrack/config.hpp>
#include <boxtrack/trackers/sort.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace boxtrack::test {

class TrackerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_path_ = std::filesystem::temp_directory_path() / "boxtrack_test_sort.yaml";
    }

    void TearDown() override {
        std::filesystem::remove(config_path_);
    }

    std::filesystem::path config_path_;
};

TEST_F(TrackerConfigTest, ParsesDirectScalars) {
    TrackerConfig config = parse_tracker_config(YAML::Load(
        "max_age: 5\n"
        "iou_threshold: 0.45\n"
        "per_class: true\n"
        "name: sort\n"));

    EXPECT_EQ(config.get_int("max_age", 1), 5);
    EXPECT_FLOAT_EQ(config.get_float("iou_threshold", 0.3f), 0.45f);
    EXPECT_TRUE(config.get_bool("per_class", false));
    EXPECT_EQ(config.get_string("name", ""), "sort");

    // Integers stay integers
    EXPECT_EQ(config.int_params.count("max_age"), 1u);
    EXPECT_EQ(config.float_params.count("max_age"), 0u);
}

TEST_F(TrackerConfigTest, ParsesTuningEntries) {
    TrackerConfig config = parse_tracker_config(YAML::Load(
        "min_hits:\n"
        "  type: randint\n"
        "  default: 2\n"
        "  range: [1, 5]\n"
        "iou_threshold:\n"
        "  type: uniform\n"
        "  default: 0.25\n"
        "  range: [0.1, 0.4]\n"
        "no_default:\n"
        "  type: uniform\n"));

    EXPECT_EQ(config.get_int("min_hits", 3), 2);
    EXPECT_FLOAT_EQ(config.get_float("iou_threshold", 0.3f), 0.25f);
    EXPECT_FLOAT_EQ(config.get_float("no_default", 0.7f), 0.7f);
}

TEST_F(TrackerConfigTest, MissingKeysUseDefaults) {
    TrackerConfig config;
    EXPECT_EQ(config.get_int("max_age", 4), 4);
    EXPECT_FLOAT_EQ(config.get_float("iou_threshold", 0.3f), 0.3f);
    EXPECT_FALSE(config.get_bool("flag", false));
    EXPECT_EQ(config.get_string("name", "x"), "x");
}

TEST_F(TrackerConfigTest, IntegerAcceptedAsFloat) {
    TrackerConfig config = parse_tracker_config(YAML::Load("iou_threshold: 1\n"));
    EXPECT_FLOAT_EQ(config.get_float("iou_threshold", 0.3f), 1.0f);
}

TEST_F(TrackerConfigTest, MergeReplacesKeys) {
    TrackerConfig base = parse_tracker_config(YAML::Load("max_age: 1\niou_threshold: 1\n"));
    TrackerConfig overrides;
    overrides.int_params["max_age"] = 4;
    overrides.float_params["iou_threshold"] = 0.6f;

    base.merge(overrides);
    EXPECT_EQ(base.get_int("max_age", 0), 4);
    EXPECT_FLOAT_EQ(base.get_float("iou_threshold", 0.0f), 0.6f);
    EXPECT_EQ(base.int_params.count("iou_threshold"), 0u);
}

TEST_F(TrackerConfigTest, NonMapDocumentIsEmpty) {
    TrackerConfig config = parse_tracker_config(YAML::Load("- 1\n- 2\n"));
    EXPECT_TRUE(config.int_params.empty());
    EXPECT_TRUE(config.float_params.empty());
}

TEST_F(TrackerConfigTest, LoadsFileIntoTracker) {
    {
        std::ofstream out(config_path_);
        out << "max_age: 3\n"
            << "min_hits:\n"
            << "  type: randint\n"
            << "  default: 1\n"
            << "iou_threshold: 0.2\n"
            << "max_history: 10\n";
    }

    TrackerConfig config = load_tracker_config(config_path_.string());
    trackers::Sort tracker(config);

    EXPECT_EQ(tracker.max_age(), 3);
    EXPECT_EQ(tracker.min_hits(), 1);
    EXPECT_FLOAT_EQ(tracker.iou_threshold(), 0.2f);
    EXPECT_EQ(tracker.max_history(), 10);
}

TEST_F(TrackerConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_tracker_config("/nonexistent/boxtrack/sort.yaml"), std::runtime_error);
}

TEST_F(TrackerConfigTest, MalformedYamlThrows) {
    {
        std::ofstream out(config_path_);
        out << "max_age: [1, 2\n";
    }
    EXPECT_THROW(load_tracker_config(config_path_.string()), YAML::Exception);
}

TEST_F(TrackerConfigTest, DefaultConfigPath) {
    EXPECT_EQ(get_tracker_config_path("sort"), "configs/trackers/sort.yaml");
}

} // namespace boxtrack::test
