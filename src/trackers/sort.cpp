// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/trackers/sort.hpp>
#include <boxtrack/utils/matching.hpp>
#include <boxtrack/utils/ops.hpp>
#include <utility>

namespace boxtrack::trackers {

namespace {

const char* const kUnknownLabel = "unknown";

} // namespace

// ============================================================================
// SortTrack Implementation
// ============================================================================

SortTrack::SortTrack(int id, const Detection& det, int max_history)
    : id_(id)
    , class_label_(kUnknownLabel)
    , conf_(0.0f)
    , age_(0)
    , hits_(0)
    , hit_streak_(0)
    , time_since_update_(0)
    , max_history_(max_history)
    , kf_(utils::xyxy2xysr(det.bbox))
{
}

Eigen::Vector4f SortTrack::predict() {
    // Keep the scale from going negative
    if ((kf_.x(6) + kf_.x(2)) <= 0.0f) {
        kf_.x(6) = 0.0f;
    }

    kf_.predict();
    age_++;

    if (time_since_update_ > 0) {
        hit_streak_ = 0;
    }
    time_since_update_++;

    class_label_ = kUnknownLabel;
    conf_ = 0.0f;

    return get_state();
}

void SortTrack::update(const Detection& det) {
    class_label_ = det.class_label;
    conf_ = det.confidence;

    time_since_update_ = 0;
    hits_++;
    hit_streak_++;

    kf_.update(utils::xyxy2xysr(det.bbox));
}

Eigen::Vector4f SortTrack::get_state() const {
    return utils::xysr2xyxy(kf_.measurement());
}

Eigen::Vector2f SortTrack::velocity() const {
    return kf_.x.segment<2>(4);
}

void SortTrack::record_trajectory() {
    history_.push_back(utils::box_center(get_state()));
    while (history_.size() > static_cast<size_t>(max_history_)) {
        history_.pop_front();
    }
}

TrackState SortTrack::state(int frame_count, int min_hits, int max_age) const {
    if (time_since_update_ > max_age) {
        return TrackState::Deleted;
    }
    // The grace period is counted in tracker frames, not in track age
    if (hit_streak_ >= min_hits || frame_count <= min_hits) {
        return TrackState::Confirmed;
    }
    return TrackState::Tentative;
}

Track SortTrack::to_track() const {
    Track track;
    track.id = id_;
    track.bbox = get_state();
    track.class_label = class_label_;
    track.confidence = conf_;
    track.age = age_;
    track.hits = hits_;
    track.hit_streak = hit_streak_;
    track.time_since_update = time_since_update_;
    track.velocity = velocity();
    track.history = history_;
    return track;
}

// ============================================================================
// Sort Implementation
// ============================================================================

Sort::Sort(int max_age, int min_hits, float iou_threshold, int max_history)
    : BaseTracker(max_age, min_hits, iou_threshold, max_history)
{
}

Sort::Sort(const TrackerConfig& config)
    : Sort(config.get_int("max_age", 1),
           config.get_int("min_hits", 3),
           config.get_float("iou_threshold", 0.3f),
           config.get_int("max_history", 30))
{
}

void Sort::reset() {
    BaseTracker::reset();
    trackers_.clear();
}

std::vector<Track> Sort::update(const std::vector<Detection>& dets) {
    frame_count_++;

    // Predict every track, keeping only those with a finite box
    std::vector<SortTrack> predicted;
    predicted.reserve(trackers_.size());
    std::vector<Eigen::Vector4f> predicted_boxes;
    predicted_boxes.reserve(trackers_.size());

    for (auto& trk : trackers_) {
        Eigen::Vector4f pos = trk.predict();
        if (!utils::is_finite_box(pos)) {
            continue;
        }
        predicted_boxes.push_back(pos);
        predicted.push_back(std::move(trk));
    }
    trackers_ = std::move(predicted);

    Eigen::MatrixXf trks(static_cast<Eigen::Index>(predicted_boxes.size()), 4);
    for (size_t t = 0; t < predicted_boxes.size(); ++t) {
        trks.row(static_cast<Eigen::Index>(t)) = predicted_boxes[t].transpose();
    }

    Eigen::MatrixXf det_boxes(static_cast<Eigen::Index>(dets.size()), 4);
    for (size_t d = 0; d < dets.size(); ++d) {
        det_boxes.row(static_cast<Eigen::Index>(d)) = dets[d].bbox.transpose();
    }

    utils::AssociationResult association =
        utils::associate_detections_to_trackers(det_boxes, trks, iou_threshold_);

    // Update matched trackers with assigned detections
    for (const auto& m : association.matches) {
        trackers_[m[1]].update(dets[m[0]]);
    }

    // Create new trackers for unmatched detections
    for (int det_idx : association.unmatched_detections) {
        trackers_.emplace_back(next_id(), dets[det_idx], max_history_);
    }

    // Remove dead trackers
    std::vector<SortTrack> alive;
    alive.reserve(trackers_.size());
    for (auto& trk : trackers_) {
        if (trk.state(frame_count_, min_hits_, max_age_) != TrackState::Deleted) {
            alive.push_back(std::move(trk));
        }
    }
    trackers_ = std::move(alive);

    std::vector<Track> outputs;
    outputs.reserve(trackers_.size());

    for (auto& trk : trackers_) {
        trk.record_trajectory();
        if (trk.state(frame_count_, min_hits_, max_age_) == TrackState::Confirmed) {
            outputs.push_back(trk.to_track());
        }
    }

    return outputs;
}

} // namespace boxtrack::trackers
