//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version numbers taken from the CMake project version
//==========================================================================================================
#include "mcpm/version.h"

#include <string>

#ifndef MCPM_VERSION_MAJOR
#define MCPM_VERSION_MAJOR 0
#endif
#ifndef MCPM_VERSION_MINOR
#define MCPM_VERSION_MINOR 0
#endif
#ifndef MCPM_VERSION_PATCH
#define MCPM_VERSION_PATCH 0
#endif

namespace mcpm {

VersionInfo getVersion() {
    return VersionInfo{MCPM_VERSION_MAJOR, MCPM_VERSION_MINOR, MCPM_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
}

} // namespace mcpm
