// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <boxtrack/tracker.hpp>
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace boxtrack::data {

/**
 * Detections grouped by frame number, in ascending frame order
 */
using DetectionSequence = std::map<int, std::vector<Detection>>;

/**
 * Parse detections from a text stream
 *
 * One detection per line: frame, x1, y1, x2, y2, conf, label
 * Fields are separated by commas and/or whitespace. Blank lines and lines
 * starting with '#' are skipped. The label may be omitted ("unknown").
 *
 * @param source_name Name used in error messages
 * @throws std::runtime_error naming the line for malformed input
 */
DetectionSequence parse_detections(std::istream& in, const std::string& source_name = "<stream>");

/**
 * Load detections from a text file
 * @throws std::runtime_error if the file is missing or malformed
 */
DetectionSequence load_detections(const std::filesystem::path& det_path);

} // namespace boxtrack::data
