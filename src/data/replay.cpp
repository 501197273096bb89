// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/data/replay.hpp>
#include <boxtrack/utils/mot_format.hpp>
#include <chrono>
#include <fstream>
#include <set>
#include <stdexcept>
#include <vector>

namespace boxtrack::data {

namespace {

void truncate_output(const std::filesystem::path& output_path) {
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path());
    }
    std::ofstream file(output_path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open output file: " + output_path.string());
    }
}

} // namespace

ReplaySummary replay_detections(BaseTracker& tracker,
                                const DetectionSequence& frames,
                                const std::filesystem::path& output_path,
                                const ReplayProgress& progress) {
    ReplaySummary summary;

    // Results are appended, start from an empty file
    truncate_output(output_path);
    if (frames.empty()) {
        return summary;
    }

    const int first_frame = frames.begin()->first;
    const int last_frame = frames.rbegin()->first;
    const int total_frames = last_frame - first_frame + 1;
    const std::vector<Detection> no_detections;
    std::set<int> seen_ids;

    for (int frame_id = first_frame; frame_id <= last_frame; ++frame_id) {
        auto it = frames.find(frame_id);
        const std::vector<Detection>& dets = (it != frames.end()) ? it->second : no_detections;

        auto start = std::chrono::steady_clock::now();
        std::vector<Track> tracks = tracker.update(dets);
        summary.tracking_seconds += std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();

        for (const auto& trk : tracks) {
            seen_ids.insert(trk.id);
        }
        summary.total_tracks += tracks.size();

        if (!tracks.empty()) {
            utils::write_mot_results(output_path, tracks, frame_id);
        }

        summary.frames++;
        if (progress) {
            progress(summary.frames, total_frames, dets.size(), tracks.size());
        }
    }

    summary.unique_ids = seen_ids.size();
    return summary;
}

} // namespace boxtrack::data
