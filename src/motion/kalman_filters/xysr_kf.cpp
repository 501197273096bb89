// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/motion/kalman_filters/xysr_kf.hpp>
#include <Eigen/Cholesky>

namespace boxtrack::motion {

KalmanFilterXYSR::KalmanFilterXYSR(const MeasurementVector& z) {
    // cx += vx, cy += vy, s += vs
    F = StateMatrix::Identity();
    F.topRightCorner<3, 3>() = Eigen::Matrix3f::Identity();

    H = MeasurementMatrix::Zero();
    H.leftCols<kMeasurementDim>() = MeasurementCovariance::Identity();

    x = StateVector::Zero();
    x.head<kMeasurementDim>() = z;

    // Positions are roughly known, initial velocities are not
    P = StateMatrix::Identity() * 10.0f;
    P.bottomRightCorner<3, 3>() *= 1000.0f;

    Q = StateMatrix::Identity();
    Q(4, 4) = 0.01f;
    Q(5, 5) = 0.01f;
    Q(6, 6) = 0.0001f;

    R = MeasurementCovariance::Identity();
    R.bottomRightCorner<2, 2>() *= 10.0f;
}

void KalmanFilterXYSR::predict() {
    x = F * x;
    P = F * P * F.transpose() + Q;
}

void KalmanFilterXYSR::update(const MeasurementVector& z) {
    const MeasurementVector innovation = z - H * x;
    const MeasurementCovariance S = H * P * H.transpose() + R;
    const Eigen::Matrix<float, kMeasurementDim, kStateDim> HP = H * P;

    // K = P H^T S^-1, solved as (S^-1 H P)^T since P and S are symmetric
    Eigen::Matrix<float, kStateDim, kMeasurementDim> K;
    Eigen::LLT<MeasurementCovariance> llt(S);
    if (llt.info() == Eigen::Success) {
        K = llt.solve(HP).transpose();
    } else {
        K = HP.transpose() * S.completeOrthogonalDecomposition().pseudoInverse();
    }

    x += K * innovation;

    // Joseph form keeps P symmetric positive semi-definite
    const StateMatrix I_KH = StateMatrix::Identity() - K * H;
    P = I_KH * P * I_KH.transpose() + K * R * K.transpose();
}

} // namespace boxtrack::motion
