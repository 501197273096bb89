// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <Eigen/Dense>
#include <array>
#include <vector>

namespace boxtrack::utils {

/**
 * Result of a linear assignment
 * matches hold [row, col] pairs, unmatched_a the rows and unmatched_b the columns
 * left unassigned.
 */
struct LinearAssignmentResult {
    std::vector<std::array<int, 2>> matches;
    std::vector<int> unmatched_a;
    std::vector<int> unmatched_b;
};

/**
 * Minimum-cost linear assignment (Jonker-Volgenant) without a cost limit
 * Always assigns min(rows, cols) pairs, like a rectangular Hungarian solve.
 * Costs may be negative.
 */
LinearAssignmentResult linear_assignment(const Eigen::MatrixXf& cost_matrix);

/**
 * Outcome of matching one frame's detections against predicted track boxes
 * Every detection and every tracker index appears in exactly one of the three lists.
 */
struct AssociationResult {
    std::vector<std::array<int, 2>> matches;  // [detection index, tracker index]
    std::vector<int> unmatched_detections;
    std::vector<int> unmatched_trackers;
};

/**
 * Assign detections to predicted tracker boxes by maximum total IoU
 *
 * The assignment is solved optimally over all pairs first. Solver pairs whose IoU
 * is below iou_threshold are then split back into an unmatched detection and an
 * unmatched tracker.
 *
 * @param detections (N, 4) detection boxes [x1, y1, x2, y2]
 * @param trackers (M, 4) predicted tracker boxes [x1, y1, x2, y2]
 * @param iou_threshold Minimum IoU of an accepted match
 * @return Matches in ascending detection order, unmatched lists in ascending order
 */
AssociationResult associate_detections_to_trackers(const Eigen::MatrixXf& detections,
                                                   const Eigen::MatrixXf& trackers,
                                                   float iou_threshold);

} // namespace boxtrack::utils
