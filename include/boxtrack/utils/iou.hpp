// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <Eigen/Dense>
#include <algorithm>

namespace boxtrack::utils {

/**
 * IoU of two axis-aligned boxes [x1, y1, x2, y2]
 * Returns 0 when the union area is not positive.
 */
inline float iou_pair(const Eigen::Vector4f& bbox1, const Eigen::Vector4f& bbox2) {
    float xx1 = std::max(bbox1(0), bbox2(0));
    float yy1 = std::max(bbox1(1), bbox2(1));
    float xx2 = std::min(bbox1(2), bbox2(2));
    float yy2 = std::min(bbox1(3), bbox2(3));

    float w = std::max(0.0f, xx2 - xx1);
    float h = std::max(0.0f, yy2 - yy1);
    float intersection = w * h;

    float area1 = (bbox1(2) - bbox1(0)) * (bbox1(3) - bbox1(1));
    float area2 = (bbox2(2) - bbox2(0)) * (bbox2(3) - bbox2(1));
    float union_area = area1 + area2 - intersection;

    return (union_area > 0.0f) ? (intersection / union_area) : 0.0f;
}

/**
 * Batch IoU computation for axis-aligned bounding boxes
 * Input: bboxes1 (N, 4), bboxes2 (M, 4) as [x1, y1, x2, y2]
 * Output: (N, M) matrix of IoU values
 */
inline Eigen::MatrixXf iou_batch(const Eigen::MatrixXf& bboxes1, const Eigen::MatrixXf& bboxes2) {
    const Eigen::Index N = bboxes1.rows();
    const Eigen::Index M = bboxes2.rows();

    if (N == 0 || M == 0) {
        return Eigen::MatrixXf::Zero(N, M);
    }

    Eigen::MatrixXf iou_matrix(N, M);
    for (Eigen::Index i = 0; i < N; ++i) {
        Eigen::Vector4f bbox1 = bboxes1.row(i).transpose();
        for (Eigen::Index j = 0; j < M; ++j) {
            iou_matrix(i, j) = iou_pair(bbox1, bboxes2.row(j).transpose());
        }
    }

    return iou_matrix;
}

} // namespace boxtrack::utils
