// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#include <stdexcept>
#include <string>

namespace boxtrack::utils {

/**
 * Parse a whole string as an integer
 * @throws std::invalid_argument if the text is empty, has trailing characters
 *         or is out of range
 */
inline int parse_int(const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("not an integer: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("not an integer: '" + text + "'");
    }
    return value;
}

/**
 * Parse a whole string as a float
 * @throws std::invalid_argument if the text is empty, has trailing characters
 *         or is out of range
 */
inline float parse_float(const std::string& text) {
    size_t consumed = 0;
    float value = 0.0f;
    try {
        value = std::stof(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("not a number: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("not a number: '" + text + "'");
    }
    return value;
}

} // namespace boxtrack::utils
