// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <vector>
#include <deque>
#include <string>
#include <ostream>

namespace boxtrack {

/**
 * Track state enumeration
 * Derived each frame from hit streak, frame count and time since update.
 */
enum class TrackState {
    Tentative = 0,
    Confirmed = 1,
    Deleted = 2
};

/**
 * Single detection produced by an external detector
 */
struct Detection {
    Detection() = default;
    Detection(const Eigen::Vector4f& bbox, std::string class_label, float confidence,
              cv::Mat mask = cv::Mat());

    Eigen::Vector4f bbox = Eigen::Vector4f::Zero();  // [x1, y1, x2, y2]
    std::string class_label;
    float confidence = 0.0f;
    cv::Mat mask;  // Optional pixel mask, empty when absent. Not used for tracking.
};

/**
 * Tracked object reported for one frame
 */
struct Track {
    int id = -1;
    Eigen::Vector4f bbox = Eigen::Vector4f::Zero();  // [x1, y1, x2, y2]
    std::string class_label = "unknown";
    float confidence = 0.0f;
    int age = 0;
    int hits = 0;
    int hit_streak = 0;
    int time_since_update = 0;
    Eigen::Vector2f velocity = Eigen::Vector2f::Zero();  // px/frame
    std::deque<Eigen::Vector2f> history;                 // box centers, newest last

    Eigen::Vector2f center() const;
    float speed() const;
};

std::ostream& operator<<(std::ostream& os, const Detection& det);
std::ostream& operator<<(std::ostream& os, const Track& track);

/**
 * Base tracker interface
 * All trackers should inherit from this class
 */
class BaseTracker {
public:
    /**
     * Constructor
     * @param max_age Frames a track may stay unmatched before deletion
     * @param min_hits Consecutive hits before a track is confirmed
     * @param iou_threshold Minimum IoU for a detection-track match, in [0, 1]
     * @param max_history Number of trajectory points kept per track
     * @throws std::invalid_argument on out-of-range parameters
     */
    BaseTracker(int max_age = 1,
                int min_hits = 3,
                float iou_threshold = 0.3f,
                int max_history = 30);

    virtual ~BaseTracker() = default;

    /**
     * Update tracker with the detections of one frame
     * @param dets Detections of the current frame, in any order
     * @return Tracks reported for this frame
     */
    virtual std::vector<Track> update(const std::vector<Detection>& dets) = 0;

    /**
     * Reset tracker state, including the id counter
     */
    virtual void reset();

    int frame_count() const { return frame_count_; }
    int max_age() const { return max_age_; }
    int min_hits() const { return min_hits_; }
    float iou_threshold() const { return iou_threshold_; }
    int max_history() const { return max_history_; }

protected:
    // Parameters
    int max_age_;
    int min_hits_;
    float iou_threshold_;
    int max_history_;

    // State
    int frame_count_;

    /**
     * Next track id. Ids start at 0 and are private to this instance.
     */
    int next_id() { return next_id_++; }

private:
    int next_id_;
};

} // namespace boxtrack
