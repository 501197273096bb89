// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/tracker.hpp>
#include <boxtrack/utils/ops.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace boxtrack {

Detection::Detection(const Eigen::Vector4f& bbox, std::string class_label, float confidence,
                     cv::Mat mask)
    : bbox(bbox)
    , class_label(std::move(class_label))
    , confidence(confidence)
    , mask(std::move(mask))
{
}

Eigen::Vector2f Track::center() const {
    return utils::box_center(bbox);
}

float Track::speed() const {
    return velocity.norm();
}

std::ostream& operator<<(std::ostream& os, const Detection& det) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << "Detection(" << det.class_label << ", conf=" << det.confidence
       << ", bbox=[" << det.bbox(0) << ", " << det.bbox(1) << ", "
       << det.bbox(2) << ", " << det.bbox(3) << "]";
    if (!det.mask.empty()) {
        ss << ", mask=" << det.mask.rows << "x" << det.mask.cols;
    }
    ss << ")";
    return os << ss.str();
}

std::ostream& operator<<(std::ostream& os, const Track& track) {
    std::ostringstream ss;
    ss << "Track(id=" << track.id << ", " << track.class_label
       << std::fixed << std::setprecision(2) << ", conf=" << track.confidence
       << std::setprecision(1) << ", speed=" << track.speed() << "px/frame)";
    return os << ss.str();
}

BaseTracker::BaseTracker(int max_age, int min_hits, float iou_threshold, int max_history)
    : max_age_(max_age)
    , min_hits_(min_hits)
    , iou_threshold_(iou_threshold)
    , max_history_(max_history)
    , frame_count_(0)
    , next_id_(0)
{
    if (max_age_ < 0) {
        throw std::invalid_argument("max_age must be non-negative, got " + std::to_string(max_age_));
    }
    if (min_hits_ < 0) {
        throw std::invalid_argument("min_hits must be non-negative, got " + std::to_string(min_hits_));
    }
    if (!std::isfinite(iou_threshold_) || iou_threshold_ < 0.0f || iou_threshold_ > 1.0f) {
        throw std::invalid_argument("iou_threshold must be in [0, 1], got " +
                                    std::to_string(iou_threshold_));
    }
    if (max_history_ < 1) {
        throw std::invalid_argument("max_history must be at least 1, got " +
                                    std::to_string(max_history_));
    }
}

void BaseTracker::reset() {
    frame_count_ = 0;
    next_id_ = 0;
}

} // namespace boxtrack
