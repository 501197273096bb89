// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#include <boxtrack/data/detection_file.hpp>
#include <boxtrack/utils/parse.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace boxtrack::data {

namespace {

std::runtime_error parse_error(const std::string& source_name, int line_no, const std::string& what) {
    return std::runtime_error(source_name + ":" + std::to_string(line_no) + ": " + what);
}

} // namespace

DetectionSequence parse_detections(std::istream& in, const std::string& source_name) {
    DetectionSequence frames;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;

        // Treat commas as whitespace
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream ss(line);
        std::string first;
        if (!(ss >> first) || first[0] == '#') {
            continue;
        }

        int frame_id = 0;
        try {
            frame_id = utils::parse_int(first);
        } catch (const std::invalid_argument&) {
            throw parse_error(source_name, line_no, "invalid frame number '" + first + "'");
        }

        float x1, y1, x2, y2, conf;
        if (!(ss >> x1 >> y1 >> x2 >> y2 >> conf)) {
            throw parse_error(source_name, line_no, "expected frame,x1,y1,x2,y2,conf[,label]");
        }
        if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) ||
            !std::isfinite(y2) || !std::isfinite(conf)) {
            throw parse_error(source_name, line_no, "non-finite value");
        }

        std::string label;
        if (!(ss >> label)) {
            label = "unknown";
        }

        frames[frame_id].emplace_back(Eigen::Vector4f(x1, y1, x2, y2), label, conf);
    }

    return frames;
}

DetectionSequence load_detections(const std::filesystem::path& det_path) {
    std::ifstream file(det_path);
    if (!file) {
        throw std::runtime_error("Detection file not found: " + det_path.string());
    }
    return parse_detections(file, det_path.string());
}

} // namespace boxtrack::data
