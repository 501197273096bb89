// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/utils/matching.hpp>
#include <boxtrack/utils/iou.hpp>
#include <boxtrack/association/lap_solver.hpp>
#include <algorithm>
#include <utility>

namespace boxtrack::utils {

namespace {

LinearAssignmentResult solve(const Eigen::MatrixXd& cost_matrix, double cost_limit) {
    LinearAssignmentResult result;

    association::LAPSolver::linearAssignment(
        cost_matrix,
        cost_limit,
        result.matches,
        result.unmatched_a,
        result.unmatched_b
    );

    return result;
}

} // namespace

LinearAssignmentResult linear_assignment(const Eigen::MatrixXf& cost_matrix) {
    const Eigen::Index n = cost_matrix.rows();
    const Eigen::Index m = cost_matrix.cols();

    // LAP needs double precision for the dual updates
    if (n == 0 || m == 0) {
        return solve(cost_matrix.cast<double>(), 0.0);
    }

    // Shift costs to be non-negative, then pick a limit above which leaving a pair
    // unassigned always costs more than any re-assignment of up to min(n, m) pairs.
    Eigen::MatrixXd shifted = cost_matrix.cast<double>();
    shifted.array() -= shifted.minCoeff();
    const double span = shifted.maxCoeff() + 1.0;
    const double limit = span * static_cast<double>(std::min(n, m) + 1);

    return solve(shifted, limit);
}

AssociationResult associate_detections_to_trackers(const Eigen::MatrixXf& detections,
                                                   const Eigen::MatrixXf& trackers,
                                                   float iou_threshold) {
    AssociationResult result;

    const int n_dets = static_cast<int>(detections.rows());
    const int n_trks = static_cast<int>(trackers.rows());

    if (n_trks == 0) {
        result.unmatched_detections.reserve(n_dets);
        for (int d = 0; d < n_dets; ++d) {
            result.unmatched_detections.push_back(d);
        }
        return result;
    }

    if (n_dets == 0) {
        result.unmatched_trackers.reserve(n_trks);
        for (int t = 0; t < n_trks; ++t) {
            result.unmatched_trackers.push_back(t);
        }
        return result;
    }

    // Rows are detections, columns are trackers
    Eigen::MatrixXf iou_matrix = iou_batch(detections, trackers);
    Eigen::MatrixXf cost_matrix = Eigen::MatrixXf::Ones(n_dets, n_trks) - iou_matrix;

    LinearAssignmentResult assignment = linear_assignment(cost_matrix);

    result.unmatched_detections = std::move(assignment.unmatched_a);
    result.unmatched_trackers = std::move(assignment.unmatched_b);
    result.matches.reserve(assignment.matches.size());

    for (const auto& m : assignment.matches) {
        if (iou_matrix(m[0], m[1]) < iou_threshold) {
            result.unmatched_detections.push_back(m[0]);
            result.unmatched_trackers.push_back(m[1]);
        } else {
            result.matches.push_back(m);
        }
    }

    std::sort(result.unmatched_detections.begin(), result.unmatched_detections.end());
    std::sort(result.unmatched_trackers.begin(), result.unmatched_trackers.end());

    return result;
}

} // namespace boxtrack::utils
