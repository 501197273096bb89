// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 boxtrack contributors

#include <gtest/gtest.h>
#include <boxtrack/data/replay.hpp>
#include <boxtrack/trackers/sort.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace boxtrack::data::test {

class ReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_path_ = std::filesystem::temp_directory_path() / "boxtrack_test_replay" / "tracks.txt";
        std::filesystem::remove_all(output_path_.parent_path());
    }

    void TearDown() override {
        std::filesystem::remove_all(output_path_.parent_path());
    }

    void write_stale_output() {
        std::filesystem::create_directories(output_path_.parent_path());
        std::ofstream out(output_path_);
        out << "1,0,10.00,10.00,10.00,10.00,0.90,-1,-1,-1\n";
    }

    std::vector<std::string> read_lines() const {
        std::vector<std::string> lines;
        std::ifstream in(output_path_);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path output_path_;
};

TEST_F(ReplayTest, EmptySequenceClearsStaleOutput) {
    write_stale_output();

    trackers::Sort tracker;
    ReplaySummary summary = replay_detections(tracker, DetectionSequence(), output_path_);

    EXPECT_EQ(summary.frames, 0);
    EXPECT_EQ(summary.total_tracks, 0u);
    ASSERT_TRUE(std::filesystem::exists(output_path_));
    EXPECT_TRUE(read_lines().empty());
}

TEST_F(ReplayTest, ReplacesEarlierRun) {
    write_stale_output();

    DetectionSequence frames;
    frames[5].emplace_back(Eigen::Vector4f(100, 100, 200, 200), "person", 0.9f);

    trackers::Sort tracker;
    replay_detections(tracker, frames, output_path_);

    auto lines = read_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("5,0,", 0), 0u);
}

TEST_F(ReplayTest, MissingFramesAreReplayedEmpty) {
    const Eigen::Vector4f box(100, 100, 200, 200);
    DetectionSequence frames;
    frames[1].emplace_back(box, "car", 0.8f);
    frames[2].emplace_back(box, "car", 0.8f);
    frames[4].emplace_back(box, "car", 0.8f);

    std::vector<size_t> det_counts;
    trackers::Sort tracker(1, 1, 0.3f);
    ReplaySummary summary = replay_detections(
        tracker, frames, output_path_,
        [&det_counts](int processed, int total, size_t dets, size_t) {
            EXPECT_EQ(total, 4);
            EXPECT_EQ(processed, static_cast<int>(det_counts.size()) + 1);
            det_counts.push_back(dets);
        });

    EXPECT_EQ(summary.frames, 4);
    EXPECT_EQ(tracker.frame_count(), 4);
    EXPECT_EQ(det_counts, (std::vector<size_t>{1, 1, 0, 1}));

    // The track coasts through frame 3 and is matched again on frame 4
    EXPECT_EQ(summary.unique_ids, 1u);
    EXPECT_EQ(summary.total_tracks, 4u);
    auto lines = read_lines();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].rfind("1,0,", 0), 0u);
    EXPECT_EQ(lines[1].rfind("2,0,", 0), 0u);
    EXPECT_EQ(lines[2].rfind("3,0,", 0), 0u);
    EXPECT_EQ(lines[3].rfind("4,0,", 0), 0u);
}

} // namespace boxtrack::data::test
