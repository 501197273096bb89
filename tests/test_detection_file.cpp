// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 boxtrack contributors

#include <gtest/gtest.h>
#include <boxtrack/data/detection_file.hpp>
#include <boxtrack/utils/mot_format.hpp>
#include <boxtrack/utils/parse.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace boxtrack::data::test {

class DetectionFileTest : public ::testing::Test {};

TEST_F(DetectionFileTest, ParsesFramesInOrder) {
    std::istringstream in(
        "# frame,x1,y1,x2,y2,conf,label\n"
        "3 5 5 50 50 0.5\n"
        "1,10,20,110,220,0.9,person\n"
        "\n"
        "1, 300, 300, 400, 400, 0.8, car\n");

    DetectionSequence frames = parse_detections(in);

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames.begin()->first, 1);
    EXPECT_EQ(frames.rbegin()->first, 3);

    const auto& first = frames.at(1);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].class_label, "person");
    EXPECT_FLOAT_EQ(first[0].confidence, 0.9f);
    EXPECT_FLOAT_EQ(first[0].bbox(0), 10.0f);
    EXPECT_FLOAT_EQ(first[0].bbox(3), 220.0f);
    EXPECT_EQ(first[1].class_label, "car");
    EXPECT_TRUE(first[1].mask.empty());

    const auto& third = frames.at(3);
    ASSERT_EQ(third.size(), 1u);
    EXPECT_EQ(third[0].class_label, "unknown");
}

TEST_F(DetectionFileTest, EmptyInput) {
    std::istringstream in("# nothing here\n\n");
    EXPECT_TRUE(parse_detections(in).empty());
}

TEST_F(DetectionFileTest, MissingFieldsThrow) {
    std::istringstream in("1,10,20,110\n");
    EXPECT_THROW(parse_detections(in), std::runtime_error);
}

TEST_F(DetectionFileTest, BadFrameNumberThrows) {
    std::istringstream in("frame1,10,20,110,220,0.9\n");
    EXPECT_THROW(parse_detections(in), std::runtime_error);
}

TEST_F(DetectionFileTest, ErrorNamesSourceAndLine) {
    std::istringstream in(
        "1,10,20,110,220,0.9,person\n"
        "2,10,abc,110,220,0.9,person\n");

    try {
        parse_detections(in, "dets.txt");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("dets.txt:2:"), std::string::npos) << e.what();
    }
}

TEST_F(DetectionFileTest, MissingFileThrows) {
    EXPECT_THROW(load_detections("/nonexistent/boxtrack/dets.txt"), std::runtime_error);
}

class MotFormatTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_path_ = std::filesystem::temp_directory_path() / "boxtrack_test_mot.txt";
        std::filesystem::remove(output_path_);

        Track trk;
        trk.id = 3;
        trk.bbox = Eigen::Vector4f(10, 20, 110, 220);
        trk.confidence = 0.9f;
        tracks_.push_back(trk);
    }

    void TearDown() override {
        std::filesystem::remove(output_path_);
    }

    std::filesystem::path output_path_;
    std::vector<Track> tracks_;
};

TEST_F(MotFormatTest, WritesOneRowPerTrack) {
    std::ostringstream out;
    utils::write_mot_rows(out, tracks_, 7);

    EXPECT_EQ(out.str(), "7,3,10.00,20.00,100.00,200.00,0.90,-1,-1,-1\n");
}

TEST_F(MotFormatTest, WritesLargeIdsExactly) {
    // 2^24 + 1 is the first integer a float cannot hold
    tracks_[0].id = 16777217;
    std::ostringstream out;
    utils::write_mot_rows(out, tracks_, 16777219);

    EXPECT_EQ(out.str(), "16777219,16777217,10.00,20.00,100.00,200.00,0.90,-1,-1,-1\n");
}

TEST_F(MotFormatTest, RestoresStreamFormatting) {
    std::ostringstream out;
    utils::write_mot_rows(out, tracks_, 1);
    out << 0.125f;

    EXPECT_NE(out.str().find("0.125"), std::string::npos);
}

TEST_F(MotFormatTest, AppendsRowsToFile) {
    utils::write_mot_results(output_path_, tracks_, 1);
    utils::write_mot_results(output_path_, tracks_, 2);

    std::ifstream in(output_path_);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "1,3,10.00,20.00,100.00,200.00,0.90,-1,-1,-1");
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "2,3,10.00,20.00,100.00,200.00,0.90,-1,-1,-1");
    EXPECT_FALSE(std::getline(in, line));
}

class ParseNumberTest : public ::testing::Test {};

TEST_F(ParseNumberTest, AcceptsWholeNumbers) {
    EXPECT_EQ(utils::parse_int("3"), 3);
    EXPECT_EQ(utils::parse_int("-12"), -12);
    EXPECT_FLOAT_EQ(utils::parse_float("0.45"), 0.45f);
    EXPECT_FLOAT_EQ(utils::parse_float("1"), 1.0f);
}

TEST_F(ParseNumberTest, RejectsTrailingCharacters) {
    EXPECT_THROW(utils::parse_int("3abc"), std::invalid_argument);
    EXPECT_THROW(utils::parse_int("3.5"), std::invalid_argument);
    EXPECT_THROW(utils::parse_float("0.3x"), std::invalid_argument);
    EXPECT_THROW(utils::parse_float("0.3 "), std::invalid_argument);
}

TEST_F(ParseNumberTest, RejectsEmptyAndOutOfRange) {
    EXPECT_THROW(utils::parse_int(""), std::invalid_argument);
    EXPECT_THROW(utils::parse_int("abc"), std::invalid_argument);
    EXPECT_THROW(utils::parse_int("99999999999999999999"), std::invalid_argument);
    EXPECT_THROW(utils::parse_float(""), std::invalid_argument);
    EXPECT_THROW(utils::parse_float("1e99"), std::invalid_argument);
}

} // namespace boxtrack::data::test
