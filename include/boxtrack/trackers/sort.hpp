// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <boxtrack/tracker.hpp>
#include <boxtrack/config.hpp>
#include <boxtrack/motion/kalman_filters/xysr_kf.hpp>
#include <deque>
#include <string>
#include <vector>

namespace boxtrack::trackers {

/**
 * Single track representation for SORT
 * Uses XYSR (center x, center y, scale, aspect ratio) state space
 */
class SortTrack {
public:
    SortTrack(int id, const Detection& det, int max_history = 30);

    /**
     * Advance the state one frame and return the predicted box.
     * Clears the detection attributed to this track for the new frame.
     */
    Eigen::Vector4f predict();

    /**
     * Correct the state with a matched detection
     */
    void update(const Detection& det);

    Eigen::Vector4f get_state() const;  // Returns [x1, y1, x2, y2]
    Eigen::Vector2f velocity() const;   // Returns [vx, vy]

    /**
     * Append the current box center to the trajectory, dropping the oldest points
     * beyond max_history.
     */
    void record_trajectory();

    /**
     * Lifecycle state for the tracker's current frame count
     */
    TrackState state(int frame_count, int min_hits, int max_age) const;

    Track to_track() const;

    int id() const { return id_; }
    const std::string& class_label() const { return class_label_; }
    float conf() const { return conf_; }
    int age() const { return age_; }
    int hits() const { return hits_; }
    int hit_streak() const { return hit_streak_; }
    int time_since_update() const { return time_since_update_; }
    const std::deque<Eigen::Vector2f>& history() const { return history_; }

private:
    int id_;
    std::string class_label_;
    float conf_;
    int age_;
    int hits_;
    int hit_streak_;
    int time_since_update_;
    int max_history_;

    motion::KalmanFilterXYSR kf_;
    std::deque<Eigen::Vector2f> history_;
};

/**
 * SORT (Simple Online and Realtime Tracking)
 *
 * Original paper: "Simple Online and Realtime Tracking"
 * by Alex Bewley, Zongyuan Ge, Lionel Ott, Fabio Ramos, Ben Upcroft
 * https://arxiv.org/abs/1602.00763
 *
 * - Kalman filter for motion prediction
 * - Optimal IoU assignment for data association
 * - No appearance features (motion-only)
 *
 * A track is reported once its hit streak reaches min_hits. During the first
 * min_hits frames of the tracker every live track is reported.
 */
class Sort : public BaseTracker {
public:
    Sort(int max_age = 1,
         int min_hits = 3,
         float iou_threshold = 0.3f,
         int max_history = 30);

    /**
     * Build from a loaded configuration. Missing keys take the defaults above.
     */
    explicit Sort(const TrackerConfig& config);

    std::vector<Track> update(const std::vector<Detection>& dets) override;

    void reset() override;

    /**
     * Number of live tracks, including tentative ones that are not reported
     */
    int num_tracks() const { return static_cast<int>(trackers_.size()); }

private:
    std::vector<SortTrack> trackers_;
};

} // namespace boxtrack::trackers
