// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <boxtrack/data/detection_file.hpp>
#include <boxtrack/tracker.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>

namespace boxtrack::data {

struct ReplaySummary {
    int frames = 0;
    size_t unique_ids = 0;
    size_t total_tracks = 0;
    double tracking_seconds = 0.0;  // time spent in tracker.update()
};

// Called after each frame with (processed frames, total frames, detections, tracks)
using ReplayProgress = std::function<void(int, int, size_t, size_t)>;

/**
 * Run every frame from the first to the last frame number of frames through
 * tracker and append the reported tracks to output_path as MOT rows
 *
 * output_path is truncated before the first frame, so it never keeps the rows
 * of an earlier run, even when frames is empty. Frame numbers missing from
 * frames are replayed as frames without detections.
 *
 * @throws std::runtime_error if the output file cannot be written
 */
ReplaySummary replay_detections(BaseTracker& tracker,
                                const DetectionSequence& frames,
                                const std::filesystem::path& output_path,
                                const ReplayProgress& progress = ReplayProgress());

} // namespace boxtrack::data
