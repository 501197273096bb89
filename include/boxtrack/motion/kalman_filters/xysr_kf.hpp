// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <Eigen/Dense>

namespace boxtrack::motion {

/**
 * Constant-velocity Kalman filter over box center, area and aspect ratio
 *
 * State:       [cx, cy, s, r, vx, vy, vs]
 * Observation: [cx, cy, s, r]
 *
 * The aspect ratio r is modelled as constant and has no velocity term.
 */
class KalmanFilterXYSR {
public:
    static constexpr int kStateDim = 7;
    static constexpr int kMeasurementDim = 4;

    using StateVector = Eigen::Matrix<float, kStateDim, 1>;
    using StateMatrix = Eigen::Matrix<float, kStateDim, kStateDim>;
    using MeasurementVector = Eigen::Matrix<float, kMeasurementDim, 1>;
    using MeasurementMatrix = Eigen::Matrix<float, kMeasurementDim, kStateDim>;
    using MeasurementCovariance = Eigen::Matrix<float, kMeasurementDim, kMeasurementDim>;

    /**
     * Start from an observation with zero velocities
     */
    explicit KalmanFilterXYSR(const MeasurementVector& z = MeasurementVector::Zero());

    StateMatrix F;              // transition
    MeasurementMatrix H;        // observation model
    StateVector x;              // state mean
    StateMatrix P;              // state covariance
    StateMatrix Q;              // process noise
    MeasurementCovariance R;    // measurement noise

    void predict();

    void update(const MeasurementVector& z);

    MeasurementVector measurement() const { return H * x; }
};

} // namespace boxtrack::motion
