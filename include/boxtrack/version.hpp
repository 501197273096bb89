// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#pragma once

#define BOXTRACK_VERSION_MAJOR 1
#define BOXTRACK_VERSION_MINOR 0
#define BOXTRACK_VERSION_PATCH 0
#define BOXTRACK_VERSION_STRING "1.0.0"

namespace boxtrack {

struct Version {
    static constexpr int major = BOXTRACK_VERSION_MAJOR;
    static constexpr int minor = BOXTRACK_VERSION_MINOR;
    static constexpr int patch = BOXTRACK_VERSION_PATCH;
    static constexpr const char* string = BOXTRACK_VERSION_STRING;
};

} // namespace boxtrack
