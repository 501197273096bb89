// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/config.hpp>
#include <boxtrack/trackers/sort.hpp>
#include <boxtrack/data/detection_file.hpp>
#include <boxtrack/data/replay.hpp>
#include <boxtrack/utils/parse.hpp>
#include <boxtrack/version.hpp>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <detections.txt> <output.txt> [--config file.yaml]"
              << " [--max-age N] [--min-hits N] [--iou-threshold F]\n";
    std::cerr << "Detection lines: frame,x1,y1,x2,y2,conf,label\n";
    std::cerr << "Example: " << prog << " dets.txt results/tracks.txt --config configs/trackers/sort.yaml\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string det_path = argv[1];
    std::string output_path = argv[2];

    boxtrack::TrackerConfig config;
    try {
        // Options are applied in order, so command-line values given after
        // --config override the file
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                config.merge(boxtrack::load_tracker_config(value));
            } else if (arg == "--max-age") {
                config.int_params["max_age"] = boxtrack::utils::parse_int(value);
            } else if (arg == "--min-hits") {
                config.int_params["min_hits"] = boxtrack::utils::parse_int(value);
            } else if (arg == "--iou-threshold") {
                config.int_params.erase("iou_threshold");
                config.float_params["iou_threshold"] = boxtrack::utils::parse_float(value);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid arguments: " << e.what() << "\n";
        return 1;
    }

    std::cout << "boxtrack - SORT Replay Tool v" << BOXTRACK_VERSION_STRING << "\n";
    std::cout << "==========================\n\n";

    try {
        boxtrack::trackers::Sort tracker(config);

        std::cout << "Detections: " << det_path << "\n";
        std::cout << "Output: " << output_path << "\n";
        std::cout << "max_age=" << tracker.max_age()
                  << " min_hits=" << tracker.min_hits()
                  << " iou_threshold=" << tracker.iou_threshold() << "\n\n";

        boxtrack::data::DetectionSequence frames = boxtrack::data::load_detections(det_path);

        auto summary = boxtrack::data::replay_detections(
            tracker, frames, output_path,
            [](int processed, int total, size_t dets, size_t tracks) {
                if (processed % 30 == 0) {
                    std::cout << "  Frame " << processed << "/" << total
                              << " | Detections: " << dets
                              << " | Tracks: " << tracks << "\n";
                }
            });
        if (summary.frames == 0) {
            std::cout << "No detections found\n";
            return 0;
        }

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "\nProcessed " << summary.frames << " frames\n";
        std::cout << "  Unique track ids: " << summary.unique_ids << "\n";
        std::cout << "  Avg tracks/frame: "
                  << static_cast<double>(summary.total_tracks) / summary.frames << "\n";
        std::cout << "  Avg tracking time: "
                  << summary.tracking_seconds * 1000.0 / summary.frames << " ms/frame\n";
        std::cout << "Results saved to: " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
