// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

/**
 * @file boxtrack.hpp
 * @brief Main header file for boxtrack - online bounding-box multi-object tracking
 * 
 * boxtrack assigns persistent identities to per-frame detections using a
 * constant-velocity Kalman filter per track and optimal IoU assignment.
 * 
 * @example
 * @code
 * #include <boxtrack/boxtrack.hpp>
 * 
 * boxtrack::trackers::Sort tracker(1, 3, 0.3f);
 * 
 * for (const auto& detections : frames) {
 *     std::vector<boxtrack::Track> tracks = tracker.update(detections);
 * }
 * @endcode
 */

#include <boxtrack/version.hpp>
#include <boxtrack/config.hpp>
#include <boxtrack/tracker.hpp>
#include <boxtrack/trackers/sort.hpp>

namespace boxtrack {

/**
 * @brief Library version information
 */
constexpr const char* version() noexcept {
    return BOXTRACK_VERSION_STRING;
}

} // namespace boxtrack
