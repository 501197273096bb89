// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <Eigen/Dense>
#include <cmath>

namespace boxtrack::utils {

/**
 * Center point of an [x1, y1, x2, y2] box
 */
inline Eigen::Vector2f box_center(const Eigen::Vector4f& xyxy) {
    return 0.5f * (xyxy.head<2>() + xyxy.tail<2>());
}

/**
 * [x1, y1, x2, y2] -> [cx, cy, w, h]
 */
inline Eigen::Vector4f xyxy2xywh(const Eigen::Vector4f& xyxy) {
    Eigen::Vector4f xywh;
    xywh << box_center(xyxy), xyxy.tail<2>() - xyxy.head<2>();
    return xywh;
}

/**
 * [x1, y1, x2, y2] -> [cx, cy, s, r]
 * s is the area w * h and r the aspect ratio w / h, or 1 when h is not positive.
 */
inline Eigen::Vector4f xyxy2xysr(const Eigen::Vector4f& xyxy) {
    const Eigen::Vector4f xywh = xyxy2xywh(xyxy);
    const float w = xywh(2);
    const float h = xywh(3);
    return Eigen::Vector4f(xywh(0), xywh(1), w * h, (h > 0.0f) ? (w / h) : 1.0f);
}

/**
 * [cx, cy, s, r] -> [x1, y1, x2, y2]
 * w = sqrt(s * r) and h = s / w (0 when w is not positive). A negative s * r
 * gives NaN coordinates, see is_finite_box().
 */
inline Eigen::Vector4f xysr2xyxy(const Eigen::Vector4f& xysr) {
    const float w = std::sqrt(xysr(2) * xysr(3));
    const float h = (w > 0.0f) ? (xysr(2) / w) : 0.0f;
    const Eigen::Vector2f half(0.5f * w, 0.5f * h);

    Eigen::Vector4f xyxy;
    xyxy << xysr.head<2>() - half, xysr.head<2>() + half;
    return xyxy;
}

inline bool is_finite_box(const Eigen::Vector4f& xyxy) {
    return xyxy.allFinite();
}

} // namespace boxtrack::utils
