// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <boxtrack/tracker.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace boxtrack::utils {

/**
 * Write one frame of tracks as MOT challenge rows
 * Format: frame_id,track_id,x1,y1,w,h,conf,x,y,z (10 fields)
 * For 2D tracking, x, y, z are set to -1
 */
inline void write_mot_rows(std::ostream& out, const std::vector<Track>& tracks, int frame_id) {
    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(2);

    for (const Track& trk : tracks) {
        out << frame_id << ","
            << trk.id << ","
            << trk.bbox(0) << ","                // x1 (top-left)
            << trk.bbox(1) << ","                // y1 (top-left)
            << trk.bbox(2) - trk.bbox(0) << ","  // width
            << trk.bbox(3) - trk.bbox(1) << ","  // height
            << trk.confidence << ",-1,-1,-1\n";
    }

    out.flags(flags);
    out.precision(precision);
}

/**
 * Append one frame of MOT format results to file
 * @throws std::runtime_error if the file cannot be opened
 */
inline void write_mot_results(const std::filesystem::path& output_path,
                              const std::vector<Track>& tracks,
                              int frame_id) {
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path());
    }

    std::ofstream file(output_path, std::ios::app);
    if (!file) {
        throw std::runtime_error("Cannot open output file: " + output_path.string());
    }
    write_mot_rows(file, tracks, frame_id);
}

} // namespace boxtrack::utils
